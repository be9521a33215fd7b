#pragma once

#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <nlohmann/json.hpp>

namespace agentic::protocol {

// Types that become a primitive (JSON) extension value without registration.
// User types are deliberately excluded even when they have an ADL to_json:
// implicitly flattening them to JSON is what loses their type on decode.
template <typename T>
struct is_primitive_extension_source
    : std::integral_constant<
          bool, std::is_arithmetic<std::decay_t<T>>::value ||
                    std::is_same<std::decay_t<T>, std::nullptr_t>::value ||
                    std::is_same<std::decay_t<T>, nlohmann::json>::value ||
                    std::is_convertible<T, std::string>::value> {};

// A value stored in an Extra map. Holds either a primitive JSON value or a
// typed value of some caller-defined type T (see ExtensionValue::of).
class ExtensionValue {
public:
    ExtensionValue() = default;

    template <typename T,
              std::enable_if_t<is_primitive_extension_source<T>::value &&
                                   !std::is_same<std::decay_t<T>, ExtensionValue>::value,
                               int> = 0>
    ExtensionValue(T&& value) : primitive_(std::forward<T>(value)) {}

    // Wraps a caller-defined value. T must be copyable and equality-comparable,
    // and must be registered with registry::TypeRegistry before it can be encoded.
    template <typename T>
    static ExtensionValue of(T value) {
        static_assert(!is_primitive_extension_source<T>::value,
                      "primitive values are stored without a type wrapper");
        ExtensionValue out;
        out.typed_ = std::make_unique<TypedHolder<T>>(std::move(value));
        return out;
    }

    ExtensionValue(const ExtensionValue& other);
    ExtensionValue& operator=(const ExtensionValue& other);
    ExtensionValue(ExtensionValue&&) noexcept = default;
    ExtensionValue& operator=(ExtensionValue&&) noexcept = default;
    ~ExtensionValue() = default;

    bool is_primitive() const { return typed_ == nullptr; }

    // Null for typed values.
    const nlohmann::json& primitive() const { return primitive_; }

    std::type_index type() const;

    template <typename T>
    bool holds() const {
        return typed_ != nullptr && typed_->type() == std::type_index(typeid(T));
    }

    template <typename T>
    const T* get_if() const {
        if (!holds<T>()) {
            return nullptr;
        }
        return &static_cast<const TypedHolder<T>*>(typed_.get())->value;
    }

    bool operator==(const ExtensionValue& other) const;
    bool operator!=(const ExtensionValue& other) const { return !(*this == other); }

private:
    struct Holder {
        virtual ~Holder() = default;
        virtual std::unique_ptr<Holder> clone() const = 0;
        virtual std::type_index type() const = 0;
        virtual bool equals(const Holder& other) const = 0;
    };

    template <typename T>
    struct TypedHolder final : Holder {
        explicit TypedHolder(T v) : value(std::move(v)) {}

        std::unique_ptr<Holder> clone() const override {
            return std::make_unique<TypedHolder<T>>(value);
        }
        std::type_index type() const override { return std::type_index(typeid(T)); }
        bool equals(const Holder& other) const override {
            if (other.type() != type()) {
                return false;
            }
            return static_cast<const TypedHolder<T>&>(other).value == value;
        }

        T value;
    };

    nlohmann::json primitive_;
    std::unique_ptr<Holder> typed_;
};

// Open, caller-extensible metadata attached to many content entities.
using Extra = std::map<std::string, ExtensionValue>;

}  // namespace agentic::protocol
