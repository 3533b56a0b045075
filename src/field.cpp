#include "tract/field.hpp"
#include "tract/codec.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <set>
#include <stdexcept>
#include <type_traits>


namespace Tract {

    namespace {

        std::string_view describe(const value& v) {
            switch (v.type()) {
            case kind::null: return "null";
            case kind::boolean: return "boolean";
            case kind::integer: return "integer";
            case kind::number: return "float";
            case kind::string: return "string";
            case kind::array: return "array";
            case kind::object: return "object";
            }
            return "value";
        }

        std::string_view describe(const Element& e) {
            static constexpr std::string_view names[] = {
                "string", "integer", "float", "boolean", "enum", "value", "message", "bytes", "datetime", "uuid",
            };
            return names[e.index()];
        }

        std::unexpected<Error> mismatch(std::string_view path, std::string_view expected, std::string_view got) {
            std::string msg{ "expected " };
            msg.append(expected).append(", got ").append(got);
            return std::unexpected(Error::make(Error::code::type_mismatch, path, msg));
        }

        // JSON has no spelling for these, they would come back as null
        std::unexpected<Error> non_finite(std::string_view path, double d) {
            return mismatch(path, "finite float", std::isnan(d) ? "NaN" : "infinity");
        }

        std::unexpected<Error> bad_enum(std::string_view path, const EnumType& type, std::string_view got) {
            std::string msg{ "'" };
            msg.append(got).append("' is not a member of ").append(type.name());
            return std::unexpected(Error::make(Error::code::invalid_enum_value, path, msg));
        }

        EnumValue to_value(const EnumSymbol& sym) {
            return EnumValue{ sym.name, sym.number };
        }

        int hex_digit(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // ----- base64 -----

        constexpr std::string_view base64_alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        int base64_digit(char c) noexcept {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '+') return 62;
            if (c == '/') return 63;
            return -1;
        }

        std::string to_base64(const Bytes& data) {
            std::string out;
            out.reserve((data.size() + 2) / 3 * 4);

            std::size_t i = 0;
            for (; i + 2 < data.size(); i += 3) {
                const std::uint32_t n = (std::uint32_t{ data[i] } << 16) | (std::uint32_t{ data[i + 1] } << 8) | data[i + 2];
                out.push_back(base64_alphabet[(n >> 18) & 63]);
                out.push_back(base64_alphabet[(n >> 12) & 63]);
                out.push_back(base64_alphabet[(n >> 6) & 63]);
                out.push_back(base64_alphabet[n & 63]);
            }

            if (const std::size_t rest = data.size() - i; rest != 0) {
                std::uint32_t n = std::uint32_t{ data[i] } << 16;
                if (rest == 2) n |= std::uint32_t{ data[i + 1] } << 8;
                out.push_back(base64_alphabet[(n >> 18) & 63]);
                out.push_back(base64_alphabet[(n >> 12) & 63]);
                out.push_back(rest == 2 ? base64_alphabet[(n >> 6) & 63] : '=');
                out.push_back('=');
            }
            return out;
        }

        // Padding is required, '=' may only close the last quantum
        std::optional<Bytes> from_base64(std::string_view text) {
            if (text.size() % 4 != 0) return std::nullopt;

            Bytes out;
            out.reserve(text.size() / 4 * 3);
            for (std::size_t i = 0; i < text.size(); i += 4) {
                const bool last = i + 4 == text.size();
                std::uint32_t n = 0;
                std::size_t pad = 0;
                for (std::size_t j = 0; j < 4; j++) {
                    const char c = text[i + j];
                    n <<= 6;
                    if (c == '=' && last && j >= 2) {
                        pad++;
                        continue;
                    }
                    const int d = base64_digit(c);
                    if (d < 0 || pad != 0) return std::nullopt;
                    n |= static_cast<std::uint32_t>(d);
                }
                out.push_back(static_cast<std::uint8_t>(n >> 16));
                if (pad < 2) out.push_back(static_cast<std::uint8_t>(n >> 8));
                if (pad < 1) out.push_back(static_cast<std::uint8_t>(n));
            }
            return out;
        }

        // ----- ISO 8601 -----

        constexpr Timestamp earliest_time = std::chrono::sys_days{ std::chrono::year{ 1 } / std::chrono::January / 1 };
        constexpr Timestamp end_of_time = std::chrono::sys_days{ std::chrono::year{ 10000 } / std::chrono::January / 1 };

        bool in_range(Timestamp t) noexcept {
            return t >= earliest_time && t < end_of_time;
        }

        void append_digits(std::string& out, std::int64_t n, std::size_t width) {
            char buf[24];
            const auto res = std::to_chars(buf, buf + sizeof(buf), n);
            const auto len = static_cast<std::size_t>(res.ptr - buf);
            if (len < width) out.append(width - len, '0');
            out.append(buf, res.ptr);
        }

        std::string format_iso8601(Timestamp t) {
            using namespace std::chrono;
            const sys_days date = floor<days>(t);
            const year_month_day ymd{ date };
            const hh_mm_ss<microseconds> hms{ t - date };

            std::string out;
            out.reserve(26);
            append_digits(out, static_cast<int>(ymd.year()), 4);
            out.push_back('-');
            append_digits(out, static_cast<unsigned>(ymd.month()), 2);
            out.push_back('-');
            append_digits(out, static_cast<unsigned>(ymd.day()), 2);
            out.push_back('T');
            append_digits(out, hms.hours().count(), 2);
            out.push_back(':');
            append_digits(out, hms.minutes().count(), 2);
            out.push_back(':');
            append_digits(out, hms.seconds().count(), 2);
            if (const auto us = hms.subseconds().count(); us != 0) {
                out.push_back('.');
                append_digits(out, us, 6);
            }
            return out;
        }

        class IsoReader {
        public:
            explicit IsoReader(std::string_view text) : m_Text{ text } {}

            bool done() const noexcept { return m_Pos == m_Text.size(); }
            char peek() const noexcept { return done() ? '\0' : m_Text[m_Pos]; }

            bool skip(char c) noexcept {
                if (done() || peek() != c) return false;
                m_Pos++;
                return true;
            }

            // exactly n decimal digits
            bool digits(std::size_t n, int& out) noexcept {
                if (m_Text.size() - m_Pos < n) return false;
                int v = 0;
                for (std::size_t i = 0; i < n; i++) {
                    const char c = m_Text[m_Pos + i];
                    if (c < '0' || c > '9') return false;
                    v = v * 10 + (c - '0');
                }
                m_Pos += n;
                out = v;
                return true;
            }

            // any number of fraction digits, kept to microseconds
            bool fraction(std::int64_t& micros) noexcept {
                std::size_t count = 0;
                micros = 0;
                while (!done() && peek() >= '0' && peek() <= '9') {
                    if (count < 6) micros = micros * 10 + (peek() - '0');
                    count++;
                    m_Pos++;
                }
                for (std::size_t i = count; i < 6; i++) micros *= 10;
                return count != 0;
            }

        private:
            std::string_view m_Text;
            std::size_t m_Pos = 0;
        };

        std::optional<Timestamp> parse_iso8601(std::string_view text) {
            using namespace std::chrono;
            IsoReader in{ text };

            int y = 0, mo = 0, d = 0;
            if (!in.digits(4, y) || !in.skip('-') || !in.digits(2, mo) || !in.skip('-') || !in.digits(2, d)) return std::nullopt;
            const year_month_day ymd{ year{ y }, month{ static_cast<unsigned>(mo) }, day{ static_cast<unsigned>(d) } };
            if (!ymd.ok()) return std::nullopt;

            int h = 0, mi = 0, sec = 0;
            std::int64_t micros = 0;
            minutes offset{ 0 };

            if (!in.done()) {
                if (!in.skip('T') && !in.skip('t') && !in.skip(' ')) return std::nullopt;
                if (!in.digits(2, h) || !in.skip(':') || !in.digits(2, mi)) return std::nullopt;
                if (in.skip(':')) {
                    if (!in.digits(2, sec)) return std::nullopt;
                    if ((in.skip('.') || in.skip(',')) && !in.fraction(micros)) return std::nullopt;
                }
                if (h > 23 || mi > 59 || sec > 59) return std::nullopt;

                const char zone = in.peek();
                if (zone == 'Z' || zone == 'z') {
                    in.skip(zone);
                } else if (zone == '+' || zone == '-') {
                    in.skip(zone);
                    int oh = 0, om = 0;
                    if (!in.digits(2, oh)) return std::nullopt;
                    if (!in.done()) {
                        in.skip(':');
                        if (!in.digits(2, om)) return std::nullopt;
                    }
                    if (oh > 23 || om > 59) return std::nullopt;
                    offset = hours{ oh } + minutes{ om };
                    if (zone == '-') offset = -offset;
                }
            }
            if (!in.done()) return std::nullopt;

            const Timestamp t = sys_days{ ymd } + hours{ h } + minutes{ mi } + seconds{ sec } + microseconds{ micros } - offset;
            if (!in_range(t)) return std::nullopt;
            return t;
        }

        std::unexpected<Error> bad_text(std::string_view path, std::string_view expected, std::string_view got) {
            std::string quoted{ "'" };
            quoted.append(got).append("'");
            return mismatch(path, expected, std::string_view{ quoted });
        }

    } // namespace


#pragma region Enumerations

    EnumType::EnumType(std::string name, std::vector<EnumSymbol> symbols)
        : m_Name{ std::move(name) }, m_Symbols{ std::move(symbols) } {}

    const EnumSymbol* EnumType::find(std::string_view name) const noexcept {
        auto it = std::ranges::find(m_Symbols, name, &EnumSymbol::name);
        return it == m_Symbols.end() ? nullptr : std::addressof(*it);
    }

    const EnumSymbol* EnumType::find(std::int64_t number) const noexcept {
        auto it = std::ranges::find(m_Symbols, number, &EnumSymbol::number);
        return it == m_Symbols.end() ? nullptr : std::addressof(*it);
    }

    EnumValue EnumType::at(std::string_view name) const {
        if (auto* sym = find(name)) return to_value(*sym);
        throw std::out_of_range{ "Tract::EnumType::at: no symbol " + std::string{ name } + " in " + m_Name };
    }

    EnumTypePtr make_enum(std::string name, std::vector<EnumSymbol> symbols) {
        if (symbols.empty()) throw SchemaError{ "enum " + name + " declares no symbols" };

        std::set<std::string_view> names;
        std::set<std::int64_t> numbers;
        for (const auto& sym : symbols) {
            if (sym.name.empty()) throw SchemaError{ "enum " + name + " has a symbol with an empty name" };
            if (!names.insert(sym.name).second) throw SchemaError{ "enum " + name + " declares " + sym.name + " twice" };
            if (!numbers.insert(sym.number).second) {
                throw SchemaError{ "enum " + name + " reuses number " + std::to_string(sym.number) };
            }
        }
        return std::make_shared<const EnumType>(std::move(name), std::move(symbols));
    }

#pragma endregion
#pragma region Scalars

    ElementResult StringKind::coerce(Element e, std::string_view path) const {
        if (!std::holds_alternative<std::string>(e)) return mismatch(path, name, describe(e));
        return e;
    }

    ElementResult StringKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_string()) return mismatch(path, name, describe(v));
        return Element{ std::string{ v.as_string() } };
    }

    value StringKind::encode(const Element& e) const {
        return value{ std::string_view{ std::get<std::string>(e) } };
    }

    ElementResult IntegerKind::coerce(Element e, std::string_view path) const {
        if (!std::holds_alternative<std::int64_t>(e)) return mismatch(path, name, describe(e));
        return e;
    }

    ElementResult IntegerKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_integer()) return mismatch(path, name, describe(v));
        return Element{ v.as_integer() };
    }

    value IntegerKind::encode(const Element& e) const {
        return value{ std::get<std::int64_t>(e) };
    }

    ElementResult FloatKind::coerce(Element e, std::string_view path) const {
        if (auto* i = std::get_if<std::int64_t>(&e)) return Element{ static_cast<double>(*i) };
        auto* d = std::get_if<double>(&e);
        if (!d) return mismatch(path, name, describe(e));
        if (!std::isfinite(*d)) return non_finite(path, *d);
        return e;
    }

    ElementResult FloatKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_number()) return mismatch(path, name, describe(v));
        if (!std::isfinite(v.number_value())) return non_finite(path, v.number_value());
        return Element{ v.number_value() };
    }

    value FloatKind::encode(const Element& e) const {
        return value{ std::get<double>(e) };
    }

    ElementResult BooleanKind::coerce(Element e, std::string_view path) const {
        if (!std::holds_alternative<bool>(e)) return mismatch(path, name, describe(e));
        return e;
    }

    ElementResult BooleanKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_bool()) return mismatch(path, name, describe(v));
        return Element{ v.as_bool() };
    }

    value BooleanKind::encode(const Element& e) const {
        return value{ std::get<bool>(e) };
    }

#pragma endregion
#pragma region Enum

    ElementResult EnumKind::coerce(Element e, std::string_view path) const {
        if (auto* ev = std::get_if<EnumValue>(&e)) {
            const EnumSymbol* sym = type->find(std::string_view{ ev->name });
            if (!sym || sym->number != ev->number) return bad_enum(path, *type, ev->name);
            return e;
        }
        if (auto* s = std::get_if<std::string>(&e)) {
            if (const EnumSymbol* sym = type->find(std::string_view{ *s })) return Element{ to_value(*sym) };
            return bad_enum(path, *type, *s);
        }
        if (auto* n = std::get_if<std::int64_t>(&e)) {
            if (const EnumSymbol* sym = type->find(*n)) return Element{ to_value(*sym) };
            return bad_enum(path, *type, std::to_string(*n));
        }
        return mismatch(path, type->name(), describe(e));
    }

    ElementResult EnumKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (v.is_string()) {
            if (const EnumSymbol* sym = type->find(std::string_view{ v.as_string() })) return Element{ to_value(*sym) };
            return bad_enum(path, *type, v.as_string());
        }
        if (v.is_integer()) {
            if (const EnumSymbol* sym = type->find(v.as_integer())) return Element{ to_value(*sym) };
            return bad_enum(path, *type, std::to_string(v.as_integer()));
        }
        return mismatch(path, type->name(), describe(v));
    }

    value EnumKind::encode(const Element& e) const {
        return value{ std::string_view{ std::get<EnumValue>(e).name } };
    }

#pragma endregion
#pragma region Message

    ElementResult MessageKind::coerce(Element e, std::string_view path) const {
        SchemaPtr expected = schema.lock();
        auto* nested = std::get_if<Nested>(&e);
        if (!nested) return mismatch(path, expected->name(), describe(e));
        if ((*nested)->schema() != expected) return mismatch(path, expected->name(), (*nested)->schema()->name());
        return e;
    }

    ElementResult MessageKind::decode(const value& v, const DecodeOptions& opts, std::string_view path) const {
        SchemaPtr expected = schema.lock();
        if (!v.is_object()) return mismatch(path, expected->name(), describe(v));
        auto msg = detail::Codec::decode_object(expected, v, opts, path);
        if (!msg) return std::unexpected(std::move(msg.error()));
        return Element{ Nested{ *std::move(msg) } };
    }

    value MessageKind::encode(const Element& e) const {
        return detail::Codec::encode_object(*std::get<Nested>(e));
    }

#pragma endregion
#pragma region Untyped

    ElementResult UntypedKind::coerce(Element e, std::string_view path) const {
        // non-native values take their JSON text form
        if (auto* d = std::get_if<double>(&e); d && !std::isfinite(*d)) return non_finite(path, *d);
        return std::visit([](auto&& x) -> Element {
            using T = std::remove_cvref_t<decltype(x)>;
            if constexpr (std::same_as<T, value>) return std::move(x);
            else if constexpr (std::same_as<T, std::string>) return value{ std::string_view{ x } };
            else if constexpr (std::same_as<T, EnumValue>) return value{ std::string_view{ x.name } };
            else if constexpr (std::same_as<T, Nested>) return detail::Codec::encode_object(*x);
            else if constexpr (std::same_as<T, Bytes>) return value{ std::string_view{ to_base64(x) } };
            else if constexpr (std::same_as<T, Timestamp>) return value{ std::string_view{ format_iso8601(x) } };
            else if constexpr (std::same_as<T, Uuid>) return value{ std::string_view{ x.to_string() } };
            else return value{ x };
        }, std::move(e));
    }

    ElementResult UntypedKind::decode(const value& v, const DecodeOptions&, std::string_view) const {
        return Element{ v };
    }

    value UntypedKind::encode(const Element& e) const {
        return std::get<value>(e);
    }

    ElementResult MappingKind::coerce(Element e, std::string_view path) const {
        auto* v = std::get_if<value>(&e);
        if (!v) return mismatch(path, name, describe(e));
        if (!v->is_object()) return mismatch(path, name, describe(*v));
        return e;
    }

    ElementResult MappingKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_object()) return mismatch(path, name, describe(v));
        return Element{ v };
    }

    value MappingKind::encode(const Element& e) const {
        return std::get<value>(e);
    }

#pragma endregion
#pragma region Bytes

    ElementResult BytesKind::coerce(Element e, std::string_view path) const {
        if (!std::holds_alternative<Bytes>(e)) return mismatch(path, name, describe(e));
        return e;
    }

    ElementResult BytesKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_string()) return mismatch(path, name, describe(v));
        auto data = from_base64(v.as_string());
        if (!data) return bad_text(path, "base64", v.as_string());
        return Element{ *std::move(data) };
    }

    value BytesKind::encode(const Element& e) const {
        return value{ std::string_view{ to_base64(std::get<Bytes>(e)) } };
    }

#pragma endregion
#pragma region Date-time

    ElementResult DateTimeKind::coerce(Element e, std::string_view path) const {
        auto* t = std::get_if<Timestamp>(&e);
        if (!t) return mismatch(path, name, describe(e));
        if (!in_range(*t)) return mismatch(path, "datetime in years 1 to 9999", "out of range datetime");
        return e;
    }

    ElementResult DateTimeKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_string()) return mismatch(path, name, describe(v));
        auto t = parse_iso8601(v.as_string());
        if (!t) return bad_text(path, "ISO 8601 datetime", v.as_string());
        return Element{ *t };
    }

    value DateTimeKind::encode(const Element& e) const {
        return value{ std::string_view{ format_iso8601(std::get<Timestamp>(e)) } };
    }

    ElementResult DateTimeMsKind::coerce(Element e, std::string_view path) const {
        auto* t = std::get_if<Timestamp>(&e);
        if (!t) return mismatch(path, name, describe(e));
        if (!in_range(*t)) return mismatch(path, "datetime in years 1 to 9999", "out of range datetime");
        return Element{ Timestamp{ std::chrono::floor<std::chrono::milliseconds>(*t) } };
    }

    ElementResult DateTimeMsKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        using std::chrono::milliseconds;
        if (!v.is_integer()) return mismatch(path, name, describe(v));

        // compare in milliseconds, converting first could overflow
        const std::int64_t ms = v.as_integer();
        const auto first = std::chrono::floor<milliseconds>(earliest_time).time_since_epoch().count();
        const auto last = std::chrono::floor<milliseconds>(end_of_time).time_since_epoch().count();
        if (ms < first || ms >= last) return mismatch(path, "datetime in years 1 to 9999", std::to_string(ms));

        return Element{ Timestamp{ milliseconds{ ms } } };
    }

    value DateTimeMsKind::encode(const Element& e) const {
        const auto ms = std::chrono::floor<std::chrono::milliseconds>(std::get<Timestamp>(e));
        return value{ static_cast<std::int64_t>(ms.time_since_epoch().count()) };
    }

#pragma endregion
#pragma region UUID

    std::optional<Uuid> Uuid::parse(std::string_view text) noexcept {
        if (text.starts_with("urn:uuid:")) text.remove_prefix(9);
        if (text.size() >= 2 && text.front() == '{' && text.back() == '}') text = text.substr(1, text.size() - 2);

        Uuid out;
        std::size_t nibble = 0;
        for (char c : text) {
            if (c == '-') continue;
            const int d = hex_digit(c);
            if (d < 0 || nibble == 32) return std::nullopt;
            const int shift = nibble % 2 == 0 ? 4 : 0;
            out.bytes[nibble / 2] = static_cast<std::uint8_t>(out.bytes[nibble / 2] | (d << shift));
            nibble++;
        }
        if (nibble != 32) return std::nullopt;
        return out;
    }

    std::string Uuid::to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (std::size_t i = 0; i < bytes.size(); i++) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
            out.push_back(digits[bytes[i] >> 4]);
            out.push_back(digits[bytes[i] & 0x0F]);
        }
        return out;
    }

    ElementResult UuidKind::coerce(Element e, std::string_view path) const {
        if (!std::holds_alternative<Uuid>(e)) return mismatch(path, name, describe(e));
        return e;
    }

    ElementResult UuidKind::decode(const value& v, const DecodeOptions&, std::string_view path) const {
        if (!v.is_string()) return mismatch(path, name, describe(v));
        auto id = Uuid::parse(v.as_string());
        if (!id) return bad_text(path, "UUID", v.as_string());
        return Element{ *id };
    }

    value UuidKind::encode(const Element& e) const {
        return value{ std::string_view{ std::get<Uuid>(e).to_string() } };
    }

#pragma endregion

    std::string_view kind_name(const FieldKind& kind) noexcept {
        return std::visit([](const auto& k) { return k.name; }, kind);
    }

    ElementResult coerce(const FieldKind& kind, Element e, std::string_view path) {
        return std::visit([&](const auto& k) { return k.coerce(std::move(e), path); }, kind);
    }

    ElementResult decode(const FieldKind& kind, const value& v, const DecodeOptions& opts, std::string_view path) {
        return std::visit([&](const auto& k) { return k.decode(v, opts, path); }, kind);
    }

    value encode(const FieldKind& kind, const Element& e) {
        return std::visit([&](const auto& k) { return k.encode(e); }, kind);
    }

} // namespace Tract
