#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rid/core/errors.hpp"
#include "rid/core/resource_id.hpp"
#include "rid/core/ulid.hpp"
#include "rid/schema/schema.hpp"

namespace rid::json {

    // Thrown by from_json when a string value does not parse. what() is the
    // description of the underlying failure; status() keeps the typed cause.
    class DecodeError : public std::runtime_error {
    public:
        DecodeError(rid::core::Status status, const std::string& message)
            : std::runtime_error(message), status_(status) {}

        [[nodiscard]] rid::core::Status status() const noexcept { return status_; }

    private:
        rid::core::Status status_;
    };

    // {"type": ..., "format": ..., "title": ..., "description": ...}, null fields omitted.
    [[nodiscard]] nlohmann::json schema_to_json(const rid::schema::SchemaObject& schema);

    template <rid::schema::SchemaDescribable T>
    [[nodiscard]] nlohmann::json schema_for() {
        return schema_to_json(rid::schema::SchemaTraits<T>::describe());
    }

    // {"$defs": {<name>: <schema>, ...}}
    template <rid::schema::SchemaDescribable... Ts>
    [[nodiscard]] nlohmann::json schema_definitions() {
        nlohmann::json defs = nlohmann::json::object();
        ((defs[rid::schema::SchemaTraits<Ts>::kName] = schema_for<Ts>()), ...);
        return nlohmann::json{{"$defs", std::move(defs)}};
    }

} // namespace rid::json

// ADL hooks for nlohmann::json; both types travel as bare strings.
namespace rid::core {
    void to_json(nlohmann::json& j, const Ulid& u);
    void from_json(const nlohmann::json& j, Ulid& u);

    void to_json(nlohmann::json& j, const ResourceId& id);
    void from_json(const nlohmann::json& j, ResourceId& id);
} // namespace rid::core
