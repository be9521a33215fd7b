#include "protocol/extension_value.hpp"

namespace agentic::protocol {

ExtensionValue::ExtensionValue(const ExtensionValue& other)
    : primitive_(other.primitive_),
      typed_(other.typed_ ? other.typed_->clone() : nullptr) {}

ExtensionValue& ExtensionValue::operator=(const ExtensionValue& other) {
    if (this == &other) {
        return *this;
    }
    primitive_ = other.primitive_;
    typed_ = other.typed_ ? other.typed_->clone() : nullptr;
    return *this;
}

std::type_index ExtensionValue::type() const {
    if (typed_) {
        return typed_->type();
    }
    return std::type_index(typeid(nlohmann::json));
}

bool ExtensionValue::operator==(const ExtensionValue& other) const {
    if (is_primitive() != other.is_primitive()) {
        return false;
    }
    if (is_primitive()) {
        return primitive_ == other.primitive_;
    }
    return typed_->equals(*other.typed_);
}

}  // namespace agentic::protocol
