#include "tract/error.hpp"

namespace Tract {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    Error Error::make(code c, std::string_view field, std::string_view m) {
        Error e;
        e.errc = c;
        e.field.assign(field.begin(), field.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(Error::code c) noexcept {
        switch (c) {
        case Error::code::type_mismatch: return "type_mismatch";
        case Error::code::invalid_enum_value: return "invalid_enum_value";
        case Error::code::required_field_missing: return "required_field_missing";
        case Error::code::malformed_input: return "malformed_input";
        case Error::code::unknown_field: return "unknown_field";
        }
        return "unknown";
    }

    std::string_view title(Error::code c) noexcept {
        switch (c) {
        case Error::code::type_mismatch: return "Type mismatch";
        case Error::code::invalid_enum_value: return "Invalid enum value";
        case Error::code::required_field_missing: return "Required field missing";
        case Error::code::malformed_input: return "Malformed input";
        case Error::code::unknown_field: return "Unknown field";
        }
        return "Error";
    }

} // namespace Tract
