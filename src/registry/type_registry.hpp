#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/schema_errors.hpp"
#include "protocol/extension_value.hpp"

namespace agentic::registry {

// Type id reserved for primitive (plain JSON) extension values.
inline constexpr const char* kPrimitiveTypeId = "json";

using EncodeFn = std::function<nlohmann::json(const protocol::ExtensionValue&)>;
// May throw; the codec reports a throwing decoder as a corrupt payload.
using DecodeFn = std::function<protocol::ExtensionValue(const nlohmann::json&)>;

struct TypeDescriptor {
    std::string type_id;
    std::type_index type;
    EncodeFn encode;
    DecodeFn decode;
};

// Maps stable type ids to codecs for caller-defined extension value types.
// Registration takes an exclusive lock, lookups a shared one, so lookups from
// many encode/decode threads never block each other.
class TypeRegistry {
public:
    // Uses T's nlohmann to_json/from_json.
    template <typename T>
    core::errors::Status register_type(const std::string& type_id) {
        return register_type<T>(
            type_id, [](const T& value) { return nlohmann::json(value); },
            [](const nlohmann::json& payload) { return payload.get<T>(); });
    }

    template <typename T>
    core::errors::Status register_type(const std::string& type_id,
                                       std::function<nlohmann::json(const T&)> encode,
                                       std::function<T(const nlohmann::json&)> decode) {
        auto descriptor = std::make_shared<TypeDescriptor>(TypeDescriptor{
            type_id, std::type_index(typeid(T)),
            [encode = std::move(encode)](const protocol::ExtensionValue& value) {
                return encode(*value.get_if<T>());
            },
            [decode = std::move(decode)](const nlohmann::json& payload) {
                return protocol::ExtensionValue::of<T>(decode(payload));
            }});
        return insert(std::move(descriptor));
    }

    core::errors::Result<std::shared_ptr<const TypeDescriptor>> lookup(
        const std::string& type_id) const;

    // Reverse lookup used on encode.
    core::errors::Result<std::shared_ptr<const TypeDescriptor>> lookup(
        const std::type_index& type) const;

    bool contains(const std::string& type_id) const;
    std::size_t size() const;
    std::vector<std::string> type_ids() const;

private:
    core::errors::Status insert(std::shared_ptr<const TypeDescriptor> descriptor);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const TypeDescriptor>> by_id_;
    std::unordered_map<std::type_index, std::shared_ptr<const TypeDescriptor>> by_type_;
};

}  // namespace agentic::registry
