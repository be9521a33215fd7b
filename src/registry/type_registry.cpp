#include "registry/type_registry.hpp"

#include <algorithm>
#include <mutex>
#include "core/logging/logger.hpp"

namespace agentic::registry {

using core::errors::ErrorKind;
using core::errors::SchemaError;

core::errors::Status TypeRegistry::insert(std::shared_ptr<const TypeDescriptor> descriptor) {
    const std::string type_id = descriptor->type_id;
    if (type_id.empty()) {
        return SchemaError{ErrorKind::RegistrationConflict,
                           "Extension type id cannot be empty.", "invalid_type_id"};
    }
    if (type_id == kPrimitiveTypeId) {
        return SchemaError{ErrorKind::RegistrationConflict,
                           "Extension type id '" + type_id + "' is reserved.",
                           "reserved_type_id",
                           "Pick a namespaced id such as \"vendor.Status\"."};
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto by_id = by_id_.find(type_id);
    if (by_id != by_id_.end()) {
        if (by_id->second->type == descriptor->type) {
            // Same binding again: keep the first descriptor.
            return core::errors::ok();
        }
        return SchemaError{ErrorKind::RegistrationConflict,
                           "Extension type id '" + type_id +
                               "' is already bound to a different type.",
                           "type_id_conflict"};
    }

    const auto by_type = by_type_.find(descriptor->type);
    if (by_type != by_type_.end()) {
        return SchemaError{ErrorKind::RegistrationConflict,
                           "Type is already registered as '" + by_type->second->type_id +
                               "', cannot also register it as '" + type_id + "'.",
                           "type_already_registered"};
    }

    by_type_.emplace(descriptor->type, descriptor);
    by_id_.emplace(type_id, std::move(descriptor));
    lock.unlock();

    LOG_INFO("Registered extension type: " + type_id);
    return core::errors::ok();
}

core::errors::Result<std::shared_ptr<const TypeDescriptor>> TypeRegistry::lookup(
    const std::string& type_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = by_id_.find(type_id);
    if (it == by_id_.end()) {
        return SchemaError{ErrorKind::UnknownExtensionType,
                           "Extension type '" + type_id + "' is not registered.",
                           "unknown_extension_type",
                           "Register the type before decoding payloads that carry it."};
    }
    return it->second;
}

core::errors::Result<std::shared_ptr<const TypeDescriptor>> TypeRegistry::lookup(
    const std::type_index& type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return SchemaError{ErrorKind::UnregisteredExtensionValue,
                           std::string("Extension value of type ") + type.name() +
                               " has no registered type id.",
                           "unregistered_extension_value",
                           "Call TypeRegistry::register_type for this type."};
    }
    return it->second;
}

bool TypeRegistry::contains(const std::string& type_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_id_.find(type_id) != by_id_.end();
}

std::size_t TypeRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_id_.size();
}

std::vector<std::string> TypeRegistry::type_ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        ids.reserve(by_id_.size());
        for (const auto& entry : by_id_) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace agentic::registry
