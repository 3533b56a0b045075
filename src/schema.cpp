#include "tract/schema.hpp"
#include "tract/message.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>


namespace Tract {

    namespace {

        // Owns every schema ever declared. Fields refer to each other weakly.
        struct SchemaPool {
            std::mutex mutex;
            std::vector<std::shared_ptr<Schema>> schemas;

            void adopt(std::shared_ptr<Schema> schema) {
                std::lock_guard lock{ mutex };
                schemas.push_back(std::move(schema));
            }
        };

        SchemaPool& pool() {
            static SchemaPool instance;
            return instance;
        }

    } // namespace

    SchemaPtr SchemaRef::lock() const {
        SchemaPtr schema = m_Schema.lock();
        if (!schema) throw SchemaError{ "schema reference is empty" };
        if (!schema->defined()) throw SchemaError{ "schema " + schema->name() + " is referenced before it was built" };
        return schema;
    }


#pragma region Schema

    const FieldDescriptor* Schema::find(std::string_view name) const noexcept {
        auto it = m_Index.find(name);
        if (it == m_Index.end()) return nullptr;
        return &m_Fields[it->second];
    }

    const FieldDescriptor& Schema::at(std::string_view name) const {
        if (auto* fd = find(name)) return *fd;
        throw std::out_of_range{ "Tract::Schema::at: " + m_Name + " has no field " + std::string{ name } };
    }

    std::optional<std::size_t> Schema::index_of(std::string_view name) const noexcept {
        auto it = m_Index.find(name);
        if (it == m_Index.end()) return std::nullopt;
        return it->second;
    }

    std::expected<void, Error> Schema::validate_complete(const Message& msg) const {
        return validate_complete(msg, {});
    }

    std::expected<void, Error> Schema::validate_complete(const Message& msg, const std::string& prefix) const {
        auto path_of = [&](const FieldDescriptor& fd) {
            return prefix.empty() ? fd.name : prefix + "." + fd.name;
        };

        for (const auto& fd : m_Fields) {
            const Slot& slot = msg.slot(fd.name);

            if (std::holds_alternative<Unset>(slot)) {
                if (!fd.required) continue;
                return std::unexpected(Error::make(Error::code::required_field_missing, path_of(fd),
                    "required field " + fd.name + " of " + m_Name + " is not set"));
            }

            if (!std::holds_alternative<MessageKind>(fd.kind)) continue;

            if (auto* e = std::get_if<Element>(&slot)) {
                const Message& nested = *std::get<Nested>(*e);
                if (auto r = nested.schema()->validate_complete(nested, path_of(fd)); !r) return r;
            } else if (auto* items = std::get_if<Elements>(&slot)) {
                for (std::size_t i = 0; i < items->size(); i++) {
                    const Message& nested = *std::get<Nested>((*items)[i]);
                    std::string path = path_of(fd) + "[" + std::to_string(i) + "]";
                    if (auto r = nested.schema()->validate_complete(nested, path); !r) return r;
                }
            }
        }
        return {};
    }

#pragma endregion
#pragma region Builder

    SchemaBuilder::SchemaBuilder(std::string name)
        : m_Schema{ std::make_shared<Schema>(Schema::Token{}, std::move(name)) } {
        pool().adopt(m_Schema);
    }

    SchemaRef SchemaBuilder::handle() const {
        return SchemaRef{ m_Schema };
    }

    SchemaBuilder& SchemaBuilder::field(std::string name, FieldKind kind, FieldOptions opts) {
        const std::string& schema_name = m_Schema->m_Name;
        if (m_Built) throw SchemaError{ "schema " + schema_name + " is already built" };
        if (name.empty()) throw SchemaError{ "schema " + schema_name + " declares a field with an empty name" };
        if (m_Schema->m_Index.contains(name)) throw SchemaError{ "schema " + schema_name + " declares field " + name + " twice" };
        if (opts.required && opts.repeated) throw SchemaError{ "field " + name + " of " + schema_name + " cannot be both required and repeated" };

        if (auto* ek = std::get_if<EnumKind>(&kind); ek && !ek->type) {
            throw SchemaError{ "enum field " + name + " of " + schema_name + " has no enum type" };
        }

        FieldDescriptor fd{ .name = name, .kind = std::move(kind), .repeated = opts.repeated, .required = opts.required };

        if (opts.default_value) {
            if (opts.repeated || std::holds_alternative<MessageKind>(fd.kind)) {
                throw SchemaError{ "field " + name + " of " + schema_name + " cannot have a default" };
            }
            auto def = decode(fd.kind, *opts.default_value, DecodeOptions{}, name);
            if (!def) throw SchemaError{ "invalid default for field " + name + " of " + schema_name + ": " + def.error().msg };
            fd.default_value = std::move(*def);
        }

        fd.index = m_Schema->m_Fields.size();
        m_Schema->m_Index.emplace(name, fd.index);
        m_Schema->m_Fields.push_back(std::move(fd));
        return *this;
    }

    SchemaPtr SchemaBuilder::build() {
        if (m_Built) throw SchemaError{ "schema " + m_Schema->m_Name + " is already built" };

        m_Schema->m_Defined = true;
        m_Built = true;
        return m_Schema;
    }

#pragma endregion

} // namespace Tract
