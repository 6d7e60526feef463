#include "rid/json/json.hpp"

namespace rid::json {

nlohmann::json schema_to_json(const rid::schema::SchemaObject& schema) {
    nlohmann::json j = nlohmann::json::object();
    j["type"] = rid::schema::instance_type_name(schema.type);
    if (schema.format != nullptr) {
        j["format"] = schema.format;
    }
    if (schema.title != nullptr) {
        j["title"] = schema.title;
    }
    if (schema.description != nullptr) {
        j["description"] = schema.description;
    }
    return j;
}

} // namespace rid::json

namespace rid::core {

void to_json(nlohmann::json& j, const Ulid& u) {
    j = ulid_to_string(u);
}

void from_json(const nlohmann::json& j, Ulid& u) {
    // Non-strings raise nlohmann's own type_error here.
    const auto& text = j.get_ref<const nlohmann::json::string_t&>();
    Ulid parsed{};
    const Status s = ulid_parse(text, &parsed);
    if (!is_ok(s)) {
        throw rid::json::DecodeError(s, status_describe(s, text));
    }
    u = parsed;
}

void to_json(nlohmann::json& j, const ResourceId& id) {
    j = resource_id_to_string(id);
}

void from_json(const nlohmann::json& j, ResourceId& id) {
    const auto& text = j.get_ref<const nlohmann::json::string_t&>();
    ResourceId parsed{};
    const Status s = resource_id_parse(text, &parsed);
    if (!is_ok(s)) {
        throw rid::json::DecodeError(s, status_describe(s, text));
    }
    id = parsed;
}

} // namespace rid::core
