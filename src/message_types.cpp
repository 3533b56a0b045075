#include "tract/message_types.hpp"


namespace Tract {

    const SchemaPtr& void_message_schema() {
        static const SchemaPtr schema = SchemaBuilder{ "VoidMessage" }.build();
        return schema;
    }

    const SchemaPtr& error_message_schema() {
        static const SchemaPtr schema = [] {
            SchemaBuilder b{ "ErrorMessage" };
            b.field("title", StringKind{})
             .field("message", StringKind{})
             .field("explanation", StringKind{});
            return b.build();
        }();
        return schema;
    }

    Message make_error_message(const Error& err) {
        Message msg{ error_message_schema() };
        msg.set("title", title(err.errc)).value();
        msg.set("message", err.msg).value();
        if (!err.field.empty()) msg.set("explanation", err.field).value();
        return msg;
    }

} // namespace Tract
