#include "tract/json.hpp"
#include "tract/message.hpp"

#include <algorithm>
#include <sstream>
#include <charconv>
#include <cctype>
#include <cmath>
#include <vector>


namespace Tract {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        if (is.bad()) return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 1, 1, "Failed to read input stream"));
        return detail::parse_impl(oss.str(), opts);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::dump_impl(v, oss, opts, 0);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::dump_impl(v, os, opts, 0);
    }

    std::string encode_message(const Message& msg, const WriteOptions& opts) {
        return dump(encode_value(msg), opts);
    }

    void encode_message(const Message& msg, std::ostream& os, const WriteOptions& opts) {
        dump(encode_value(msg), os, opts);
    }

    DecodeResult decode_message(const SchemaPtr& schema, std::string_view text, const DecodeOptions& opts) {
        if (opts.allow_empty_input && std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; })) {
            return decode_value(schema, value{ object{} }, opts);
        }

        auto parsed = parse(text, opts.parse);
        if (!parsed) {
            Error err = Error::make(Error::code::malformed_input, "", parsed.error().msg);
            err.parse = std::move(parsed.error());
            return std::unexpected(std::move(err));
        }
        if (!parsed->is_object()) {
            return std::unexpected(Error::make(Error::code::malformed_input, "", "Top-level JSON value is not an object"));
        }
        return decode_value(schema, *parsed, opts);
    }

    DecodeResult decode_message(const SchemaPtr& schema, std::istream& is, const DecodeOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        if (is.bad()) {
            Error err = Error::make(Error::code::malformed_input, "", "Failed to read input stream");
            err.parse = ParseError::make(ParseError::code::io_error, 0, 1, 1, err.msg);
            return std::unexpected(std::move(err));
        }
        return decode_message(schema, std::string_view{ oss.str() }, opts);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct Scanner {
            std::string_view text;
            const ParseOptions& opts;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;
            size_t depth = 0;
            std::pmr::memory_resource* mem_res;

            Scanner(std::string_view t, const ParseOptions& o, std::pmr::memory_resource* r)
                : text{ t }, opts{ o }, mem_res{ r } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (idx + 1 < text.size()) ? text[idx + 1] : '\0'; }
            [[nodiscard]] bool peek_digit() const noexcept { return std::isdigit(static_cast<unsigned char>(peek())) != 0; }

            char get() {
                if (eof()) return '\0';
                char c = text[idx++];
                if (c == '\n') {
                    line++;
                    column = 1;
                } else column++;
                return c;
            }

            bool consume(char c) {
                if (peek() == c) {
                    get();
                    return true;
                }
                return false;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code code, std::string_view msg) const {
                return std::unexpected(ParseError::make(code, idx, line, column, msg));
            }
        };

        // Tracks container nesting; ok() is false once max_depth is passed
        struct DepthGuard {
            Scanner& s;

            explicit DepthGuard(Scanner& sc) : s(sc) { s.depth++; }
            ~DepthGuard() { s.depth--; }

            bool ok() const { return s.opts.max_depth == 0 || s.depth <= s.opts.max_depth; }
        };

        expected_t<value> parse_value(Scanner& s);

        // Validates UTF-8 per RFC 3629: no overlongs, no surrogates, nothing past U+10FFFF
        bool is_valid_utf8(std::string_view str) {
            const auto* data = reinterpret_cast<const unsigned char*>(str.data());
            const size_t n = str.size();
            size_t i = 0;

            auto cont = [&](size_t at) { return at < n && (data[at] & 0xC0) == 0x80; };

            while (i < n) {
                unsigned char c = data[i];
                if (c <= 0x7F) { i++; continue; }

                size_t len = 0;
                unsigned char lo = 0x80, hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) len = 2;
                else if (c >= 0xE0 && c <= 0xEF) {
                    len = 3;
                    if (c == 0xE0) lo = 0xA0;
                    if (c == 0xED) hi = 0x9F;
                }
                else if (c >= 0xF0 && c <= 0xF4) {
                    len = 4;
                    if (c == 0xF0) lo = 0x90;
                    if (c == 0xF4) hi = 0x8F;
                }
                else return false;

                if (i + len > n) return false;
                if (data[i + 1] < lo || data[i + 1] > hi) return false;
                for (size_t k = 2; k < len; k++) {
                    if (!cont(i + k)) return false;
                }
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        expected_void skip_ws_and_comments(Scanner& s) {
            while (!s.eof()) {
                char c = s.peek();

                if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                    s.get();
                    continue;
                }

                if (!s.opts.allow_comments || c != '/') break;

                char next = s.peek_next();
                if (next == '/') {
                    while (!s.eof() && s.peek() != '\n') s.get();
                    continue;
                }
                if (next != '*') break;

                s.get();
                s.get();
                bool closed = false;
                while (!s.eof()) {
                    if (s.get() == '*' && s.consume('/')) {
                        closed = true;
                        break;
                    }
                }
                if (!closed) return s.fail(ParseError::code::unexpected_end_of_input, "Nonterminated block comment");
            }
            return {};
        }

        expected_void parse_literal(Scanner& s, std::string_view literal) {
            for (char expected : literal) {
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Truncated literal");
                if (s.get() != expected) return s.fail(ParseError::code::unexpected_character, "Invalid literal");
            }
            return {};
        }

        expected_t<uint16_t> parse_hex4(Scanner& s) {
            uint16_t val = 0;
            for (int i = 0; i < 4; i++) {
                if (s.eof()) return s.fail(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                char h = s.get();
                unsigned digit = 0;
                if (h >= '0' && h <= '9') digit = h - '0';
                else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                else return s.fail(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                val = static_cast<uint16_t>((val << 4) | digit);
            }
            return val;
        }

        expected_t<string> parse_string(Scanner& s) {
            if (!s.consume('"')) return s.fail(ParseError::code::invalid_string, "Expected '\"' to start a string");

            string out{ allocator_type(s.mem_res) };

            while (!s.eof()) {
                char c = s.get();
                if (c == '"') {
                    if (!is_valid_utf8(out)) return s.fail(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string");
                    return out;
                }
                if (static_cast<unsigned char>(c) < 0x20) return s.fail(ParseError::code::invalid_string, "Control character in string");
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }

                if (s.eof()) return s.fail(ParseError::code::invalid_escape, "Unfinished escape sequence");
                switch (char esc = s.get()) {
                case '"': case '\\': case '/': out.push_back(esc); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    auto first = parse_hex4(s);
                    if (!first) return std::unexpected(first.error());

                    uint32_t codepoint = *first;
                    if (*first >= 0xD800 && *first <= 0xDBFF) {
                        if (!(s.consume('\\') && s.consume('u'))) return s.fail(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
                        auto second = parse_hex4(s);
                        if (!second) return std::unexpected(second.error());
                        if (*second < 0xDC00 || *second > 0xDFFF) return s.fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");
                        codepoint = 0x10000u + ((static_cast<uint32_t>(*first - 0xD800) << 10) | static_cast<uint32_t>(*second - 0xDC00));
                    } else if (*first >= 0xDC00 && *first <= 0xDFFF) {
                        return s.fail(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate");
                    }
                    append_utf8(codepoint, out);
                    break;
                }
                default: return s.fail(ParseError::code::invalid_escape, "Invalid escape sequence");
                }
            }

            return s.fail(ParseError::code::unexpected_end_of_input, "Nonterminated string");
        }

        expected_t<value> parse_number(Scanner& s) {
            const size_t start = s.idx;
            bool integral = true;

            if (s.consume('-') && !s.peek_digit()) return s.fail(ParseError::code::unexpected_character, "Expected digit after '-'");

            char first_digit = s.get();
            if (first_digit == '0' && s.peek_digit()) return s.fail(ParseError::code::invalid_number, "Leading zeros disallowed");
            while (s.peek_digit()) s.get();

            if (s.consume('.')) {
                integral = false;
                if (!s.peek_digit()) return s.fail(ParseError::code::invalid_number, "Expected digit after '.'");
                while (s.peek_digit()) s.get();
            }

            if (s.peek() == 'e' || s.peek() == 'E') {
                integral = false;
                s.get();
                if (s.peek() == '+' || s.peek() == '-') s.get();
                if (!s.peek_digit()) return s.fail(ParseError::code::invalid_number, "Expected digit in exponent");
                while (s.peek_digit()) s.get();
            }

            if (char c = s.peek(); c == '.' || c == 'e' || c == 'E') return s.fail(ParseError::code::invalid_number, "Unexpected character after number");

            const auto token = s.text.substr(start, s.idx - start);
            const char* first = token.data();
            const char* last = token.data() + token.size();

            if (integral) {
                std::int64_t i = 0;
                auto [ptr, ec] = std::from_chars(first, last, i);
                if (ec == std::errc{} && ptr == last) return value{ i, s.mem_res };
                // out of int64 range, keep it as a double
            }

            double d = 0.0;
            auto [ptr, ec] = std::from_chars(first, last, d);
            if (ec != std::errc{} || ptr != last) return s.fail(ParseError::code::invalid_number, "Number out of range");
            return value{ d, s.mem_res };
        }

        expected_t<value> parse_array(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return s.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            s.get(); // '['

            array arr{ allocator_type(s.mem_res) };

            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume(']')) return value{ std::move(arr), s.mem_res };

            while (true) {
                auto elem = parse_value(s);
                if (!elem) return std::unexpected(std::move(elem.error()));
                arr.emplace_back(std::move(*elem));

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());

                char c = s.peek();
                if (c == ',') {
                    s.get();
                    if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                    if (s.peek() == ']') {
                        if (!s.opts.allow_trailing_commas) return s.fail(ParseError::code::unexpected_character, "Trailing commas not allowed");
                        s.get();
                        break;
                    }
                    continue;
                }
                if (c == ']') { s.get(); break; }
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                return s.fail(ParseError::code::unexpected_character, "Expected ',' or ']' in array");
            }
            return value{ std::move(arr), s.mem_res };
        }

        expected_t<value> parse_object(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return s.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            s.get(); // '{'

            value result{ object{ allocator_type(s.mem_res) }, s.mem_res };

            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume('}')) return result;

            while (true) {
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected '}' or string key");
                if (s.peek() != '"') return s.fail(ParseError::code::unexpected_character, "Expected '\"' to start object key");
                auto key = parse_string(s);
                if (!key) return std::unexpected(key.error());

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                if (!s.consume(':')) return s.fail(ParseError::code::unexpected_character, "Expected ':' after object key");

                auto val = parse_value(s);
                if (!val) return std::unexpected(val.error());
                result[*key] = std::move(*val); // last wins

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                char c = s.peek();
                if (c == ',') {
                    s.get();
                    if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                    if (s.peek() == '}') {
                        if (!s.opts.allow_trailing_commas) return s.fail(ParseError::code::unexpected_character, "Trailing commas not allowed");
                        s.get();
                        break;
                    }
                    continue;
                }
                if (c == '}') { s.get(); break; }
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                return s.fail(ParseError::code::unexpected_character, "Expected ',' or '}' in object");
            }
            return result;
        }

        expected_t<value> parse_value(Scanner& s) {
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");

            switch (char c = s.peek()) {
            case 'n':
                if (auto r = parse_literal(s, "null"); !r) return std::unexpected(r.error());
                return value{ nullptr, s.mem_res };
            case 't':
                if (auto r = parse_literal(s, "true"); !r) return std::unexpected(r.error());
                return value{ true, s.mem_res };
            case 'f':
                if (auto r = parse_literal(s, "false"); !r) return std::unexpected(r.error());
                return value{ false, s.mem_res };
            case '"': {
                auto str = parse_string(s);
                if (!str) return std::unexpected(str.error());
                return value{ std::move(*str), s.mem_res };
            }
            case '[': return parse_array(s);
            case '{': return parse_object(s);
            default:
                if (c == '-' || (c >= '0' && c <= '9')) return parse_number(s);
                if (c == '.') return s.fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                return s.fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
            }
        }

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts) {
            Scanner s{ text, opts, std::pmr::get_default_resource() };

            auto v = parse_value(s);
            if (!v) return std::unexpected(v.error());
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (!s.eof()) return s.fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
            return *std::move(v);
        }
#pragma endregion
#pragma region Serializer

        // ================================
        // Internal serializer implementation
        // ================================

        void dump_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789abcdef";
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) os << "\\u00" << hex[c >> 4] << hex[c & 0xF];
                    else os.put(static_cast<char>(c));
                    break;
                }
            }
            os.put('"');
        }

        void dump_double(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) {
                os << "0.0";
                return;
            }
            std::string_view text{ buf, static_cast<size_t>(ptr - buf) };
            os << text;
            if (text.find_first_of(".eE") == std::string_view::npos) os << ".0";
        }

        void dump_newline_indent(std::ostream& os, size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            os.put('\n');
            for (size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::integer: os << v.as_integer(); return;
            case kind::number: dump_double(v.as_number(), os); return;
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                os.put('[');
                for (size_t i = 0; i < arr.size(); i++) {
                    if (i > 0) os.put(',');
                    dump_newline_indent(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                }
                if (!arr.empty()) dump_newline_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();

                std::vector<const member*> members;
                members.reserve(obj.size());
                for (const auto& m : obj) members.push_back(&m);
                if (opts.sort_keys) {
                    std::ranges::stable_sort(members, {}, [](const member* m) { return std::string_view{ m->first }; });
                }

                os.put('{');
                for (size_t i = 0; i < members.size(); i++) {
                    if (i > 0) os.put(',');
                    dump_newline_indent(os, depth + 1, opts);
                    dump_string(members[i]->first, os);
                    os << (opts.pretty ? ": " : ":");
                    dump_impl(members[i]->second, os, opts, depth + 1);
                }
                if (!members.empty()) dump_newline_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

#pragma endregion

    } // namespace detail

} // namespace Tract
