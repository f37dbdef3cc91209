#pragma once
#include <string>
#include <variant>

namespace compgym::core::errors {

    // Typed error categories. The finer taxonomy lives in GymError::code.
    enum class ErrorCategory {
        Input,      // E.g., operation on a closed handle or an inactive environment
        Execution,  // E.g., the backend reported that an action did not run
        Resource,   // E.g., copying a file to or from the remote side failed
        Storage,    // E.g., a step file could not be written or decoded
        Lookup,     // E.g., unknown agent id, index out of range, key mismatch
        Internal    // E.g., pipe or fork failure
    };

    struct GymError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a GymError.
    template <typename T>
    using Result = std::variant<T, GymError>;

    // Result for operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GymError>(result);
    }

    template <typename T>
    const GymError& get_error(const Result<T>& result) {
        return std::get<GymError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Resource:  return "resource";
            case ErrorCategory::Storage:   return "storage";
            case ErrorCategory::Lookup:    return "lookup";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace compgym::core::errors
