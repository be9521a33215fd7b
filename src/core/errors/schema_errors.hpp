#pragma once
#include <string>
#include <utility>
#include <variant>

namespace agentic::core::errors {

    // 1. Typed error kinds, one per distinct failure a caller can act on
    enum class ErrorKind {
        VariantMismatch,             // Union tag does not match the populated payload
        UnregisteredExtensionValue,  // Encode saw an extension value with no registered type id
        UnknownExtensionType,        // Decode saw a type id this process never registered
        CorruptPayload,              // Bytes are truncated or structurally invalid
        UnsupportedVersion,          // Format version marker outside the supported range
        RegistrationConflict,        // Type id already bound to a different C++ type
        Input,                       // E.g., bad CLI flag or unreadable file
        Internal                     // Logic bug
    };

    // The standardized error payload
    struct SchemaError {
            ErrorKind kind;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a SchemaError.
    template <typename T>
    using Result = std::variant<T, SchemaError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<SchemaError>(result);
    }

    template <typename T>
    const SchemaError& get_error(const Result<T>& result) {
        return std::get<SchemaError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::VariantMismatch: return "variant_mismatch";
            case ErrorKind::UnregisteredExtensionValue: return "unregistered_extension_value";
            case ErrorKind::UnknownExtensionType: return "unknown_extension_type";
            case ErrorKind::CorruptPayload: return "corrupt_payload";
            case ErrorKind::UnsupportedVersion: return "unsupported_version";
            case ErrorKind::RegistrationConflict: return "registration_conflict";
            case ErrorKind::Input: return "input";
            case ErrorKind::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace agentic::core::errors
