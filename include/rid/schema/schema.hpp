#pragma once

#include <concepts>
#include <type_traits>

#include "rid/core/resource_id.hpp"
#include "rid/core/types.hpp"
#include "rid/core/ulid.hpp"

namespace rid::schema {
    using u8 = rid::core::u8;

    enum class InstanceType : u8 {
        String = 0,
        Integer = 1,
        Number = 2,
        Boolean = 3,
        Object = 4,
        Array = 5,
    };

    // Descriptive metadata handed to a schema renderer. Null fields are omitted.
    struct SchemaObject {
        InstanceType type{InstanceType::String};
        const char* format{nullptr};
        const char* title{nullptr};
        const char* description{nullptr};
    };

    // Specialise per type: static constexpr kName and describe().
    template <typename T>
    struct SchemaTraits;

    template <typename T>
    concept SchemaDescribable = requires {
        { SchemaTraits<T>::kName } -> std::convertible_to<const char*>;
        { SchemaTraits<T>::describe() } -> std::same_as<SchemaObject>;
    };

    template <>
    struct SchemaTraits<rid::core::Ulid> {
        static constexpr const char* kName = "Ulid";
        [[nodiscard]] static constexpr SchemaObject describe() noexcept {
            return SchemaObject{InstanceType::String, "ulid", nullptr, nullptr};
        }
    };

    template <>
    struct SchemaTraits<rid::core::ResourceId> {
        static constexpr const char* kName = "ResourceID";
        [[nodiscard]] static constexpr SchemaObject describe() noexcept {
            return SchemaObject{InstanceType::String, "ResourceID", "ResourceID", "A unique resource identifier"};
        }
    };

    [[nodiscard]] constexpr const char* instance_type_name(InstanceType t) noexcept {
        switch (t) {
            case InstanceType::String: return "string";
            case InstanceType::Integer: return "integer";
            case InstanceType::Number: return "number";
            case InstanceType::Boolean: return "boolean";
            case InstanceType::Object: return "object";
            case InstanceType::Array: return "array";
        }
        return "string";
    }

    static_assert(SchemaDescribable<rid::core::Ulid>);
    static_assert(SchemaDescribable<rid::core::ResourceId>);
    static_assert(std::is_trivially_copyable_v<SchemaObject>);
    static_assert(std::is_standard_layout_v<SchemaObject>);

} // namespace rid::schema
