#include "tract/codec.hpp"

#include <cstddef>
#include <string>


namespace Tract {

    value encode_value(const Message& msg) {
        return detail::Codec::encode_object(msg);
    }

    DecodeResult decode_value(const SchemaPtr& schema, const value& mapping, const DecodeOptions& opts) {
        return detail::Codec::decode_object(schema, mapping, opts, {});
    }

    namespace detail {

        namespace {

            // Nested messages decoded so far on this thread
            thread_local std::size_t t_Depth = 0;

            struct DepthGuard {
                DepthGuard() { t_Depth++; }
                ~DepthGuard() { t_Depth--; }
                DepthGuard(const DepthGuard&) = delete;
                DepthGuard& operator=(const DepthGuard&) = delete;

                bool ok(const DecodeOptions& opts) const { return opts.parse.max_depth == 0 || t_Depth <= opts.parse.max_depth; }
            };

            std::string join(std::string_view prefix, std::string_view name) {
                std::string path{ prefix };
                if (!path.empty()) path.push_back('.');
                path.append(name);
                return path;
            }
        } // namespace

        value Codec::encode_object(const Message& msg) {
            value out{ object{} };
            object& members = out.as_object();
            members.reserve(msg.m_Schema->size());

            for (const auto& fd : *msg.m_Schema) {
                const Slot& slot = msg.m_Slots[fd.index];
                if (std::holds_alternative<Unset>(slot)) continue;

                value encoded{};
                if (auto* e = std::get_if<Element>(&slot)) {
                    encoded = encode(fd.kind, *e);
                } else if (auto* items = std::get_if<Elements>(&slot)) {
                    array& arr = encoded.as_array();
                    arr.reserve(items->size());
                    for (const auto& item : *items) arr.push_back(encode(fd.kind, item));
                }
                // a Null slot stays null
                members.emplace_back(string{ fd.name }, std::move(encoded));
            }
            return out;
        }

        DecodeResult Codec::decode_object(const SchemaPtr& schema, const value& mapping, const DecodeOptions& opts, std::string_view path) {
            DepthGuard guard;
            if (!guard.ok(opts)) {
                return std::unexpected(Error::make(Error::code::malformed_input, path,
                    "messages nested deeper than " + std::to_string(opts.parse.max_depth) + " levels"));
            }

            Message msg{ schema };

            if (!mapping.is_object()) {
                return std::unexpected(Error::make(Error::code::type_mismatch, path, "expected an object for " + schema->name()));
            }

            for (const auto& [key, v] : mapping.as_object()) {
                const std::string field_path = join(path, key);
                const FieldDescriptor* fd = schema->find(key);
                if (!fd) {
                    if (opts.unknown_fields == UnknownFields::ignore) continue;
                    return std::unexpected(Error::make(Error::code::unknown_field, field_path,
                        schema->name() + " has no field " + std::string{ key }));
                }

                if (v.is_null()) {
                    if (fd->repeated) {
                        return std::unexpected(Error::make(Error::code::type_mismatch, field_path, "repeated field cannot be null"));
                    }
                    msg.m_Slots[fd->index] = Null{};
                    continue;
                }

                if (!fd->repeated) {
                    auto e = decode(fd->kind, v, opts, field_path);
                    if (!e) return std::unexpected(std::move(e.error()));
                    msg.m_Slots[fd->index] = std::move(*e);
                    continue;
                }

                if (!v.is_array()) {
                    return std::unexpected(Error::make(Error::code::type_mismatch, field_path, "expected an array for repeated field"));
                }

                const bool untyped = std::holds_alternative<UntypedKind>(fd->kind);
                Elements items;
                items.reserve(v.size());
                for (std::size_t i = 0; i < v.size(); i++) {
                    const std::string item_path = field_path + "[" + std::to_string(i) + "]";
                    const value& item = v.as_array()[i];
                    if (item.is_null() && !untyped) {
                        return std::unexpected(Error::make(Error::code::type_mismatch, item_path, "repeated field cannot contain null"));
                    }
                    auto e = decode(fd->kind, item, opts, item_path);
                    if (!e) return std::unexpected(std::move(e.error()));
                    items.push_back(std::move(*e));
                }
                msg.m_Slots[fd->index] = std::move(items);
            }

            if (auto r = schema->validate_complete(msg); !r) {
                Error err = std::move(r.error());
                err.field = join(path, err.field);
                return std::unexpected(std::move(err));
            }
            return msg;
        }

    } // namespace detail

} // namespace Tract
