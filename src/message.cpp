#include "tract/message.hpp"
#include "tract/codec.hpp"
#include "tract/json.hpp"

#include <ostream>
#include <stdexcept>


namespace Tract {

#pragma region Nested

    Nested::Nested(Message msg)
        : m_Msg{ std::make_unique<Message>(std::move(msg)) } {}

    Nested::Nested(const Nested& other)
        : m_Msg{ std::make_unique<Message>(*other.m_Msg) } {}

    Nested::Nested(Nested&& other) noexcept = default;

    Nested& Nested::operator=(const Nested& other) {
        if (this != &other) m_Msg = std::make_unique<Message>(*other.m_Msg);
        return *this;
    }

    Nested& Nested::operator=(Nested&& other) noexcept = default;

    Nested::~Nested() = default;

    bool operator==(const Nested& lhs, const Nested& rhs) {
        return *lhs.m_Msg == *rhs.m_Msg;
    }

    Element make_element(Message msg) {
        return Nested{ std::move(msg) };
    }

#pragma endregion
#pragma region Message

    Message::Message(SchemaPtr schema)
        : m_Schema{ std::move(schema) } {
        if (!m_Schema) throw SchemaError{ "message created without a schema" };
        if (!m_Schema->defined()) throw SchemaError{ "message created from schema " + m_Schema->name() + " before it was built" };
        m_Slots.resize(m_Schema->size());
    }

    const FieldDescriptor& Message::descriptor(std::string_view field) const {
        if (auto* fd = m_Schema->find(field)) return *fd;
        throw std::out_of_range{ "Tract::Message: " + m_Schema->name() + " has no field " + std::string{ field } };
    }

    bool Message::is_set(std::string_view field) const {
        return !std::holds_alternative<Unset>(slot(field));
    }

    const Slot& Message::slot(std::string_view field) const {
        return m_Slots[descriptor(field).index];
    }

    std::optional<Element> Message::get(std::string_view field) const {
        const FieldDescriptor& fd = descriptor(field);
        if (auto* e = std::get_if<Element>(&m_Slots[fd.index])) return *e;
        return fd.default_value;
    }

    Elements Message::get_repeated(std::string_view field) const {
        if (auto* items = std::get_if<Elements>(&m_Slots[descriptor(field).index])) return *items;
        return {};
    }

    SetResult Message::assign(std::string_view field, Element e) {
        const FieldDescriptor& fd = descriptor(field);
        if (fd.repeated) {
            return std::unexpected(Error::make(Error::code::type_mismatch, fd.name, "repeated field " + fd.name + " needs a list of values"));
        }
        auto coerced = coerce(fd.kind, std::move(e), fd.name);
        if (!coerced) return std::unexpected(std::move(coerced.error()));

        // an untyped null is the null slot, exactly as decoding produces it
        if (auto* v = std::get_if<value>(&*coerced); v && v->is_null() && std::holds_alternative<UntypedKind>(fd.kind)) {
            m_Slots[fd.index] = Null{};
            return {};
        }
        m_Slots[fd.index] = std::move(*coerced);
        return {};
    }

    SetResult Message::set(std::string_view field, Elements items) {
        const FieldDescriptor& fd = descriptor(field);
        if (!fd.repeated) {
            return std::unexpected(Error::make(Error::code::type_mismatch, fd.name, "field " + fd.name + " is not repeated"));
        }

        Elements coerced;
        coerced.reserve(items.size());
        for (std::size_t i = 0; i < items.size(); i++) {
            auto e = coerce(fd.kind, std::move(items[i]), fd.name + "[" + std::to_string(i) + "]");
            if (!e) return std::unexpected(std::move(e.error()));
            coerced.push_back(std::move(*e));
        }
        m_Slots[fd.index] = std::move(coerced);
        return {};
    }

    SetResult Message::set_null(std::string_view field) {
        const FieldDescriptor& fd = descriptor(field);
        if (fd.repeated) {
            return std::unexpected(Error::make(Error::code::type_mismatch, fd.name, "repeated field " + fd.name + " cannot be null"));
        }
        m_Slots[fd.index] = Null{};
        return {};
    }

    void Message::clear(std::string_view field) {
        m_Slots[descriptor(field).index] = Unset{};
    }

    bool operator==(const Message& lhs, const Message& rhs) {
        return lhs.m_Schema == rhs.m_Schema && lhs.m_Slots == rhs.m_Slots;
    }

    std::ostream& operator<<(std::ostream& os, const Message& msg) {
        os << '<' << msg.m_Schema->name();
        for (const auto& fd : *msg.m_Schema) {
            const Slot& slot = msg.m_Slots[fd.index];
            if (std::holds_alternative<Unset>(slot)) continue;

            os << "\n " << fd.name << ": ";
            if (std::holds_alternative<Null>(slot)) {
                os << "null";
            } else if (auto* e = std::get_if<Element>(&slot)) {
                dump(encode(fd.kind, *e), os);
            } else {
                const auto& items = std::get<Elements>(slot);
                value arr{ array{} };
                for (const auto& item : items) arr.as_array().push_back(encode(fd.kind, item));
                dump(arr, os);
            }
        }
        return os << '>';
    }

#pragma endregion

} // namespace Tract
