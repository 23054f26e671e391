#pragma once

/// @file error.hpp
/// @brief Error handling types for keystone_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace keystone_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    DependencyCycle,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::DependencyCycle: return "DependencyCycle";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Component lifecycle errors
struct ComponentError {
    enum class Kind : std::uint8_t {
        NotFound,            // Component is not active
        AlreadyActive,       // Component initialized twice
        CircularDependency,  // Re-entrant init or deinit of the same component
        NoConstructionPath,  // Neither T(HostContext&) nor T() is available
        DependentsActive,    // Teardown blocked by an active dependent
        InvalidBinding,      // Registry bound/unbound state mismatch
        ConstructionFailed,  // Construction or init hook failed (wraps cause)
        TeardownFailed,      // Teardown of a batch member failed (wraps cause)
        ReloadFailed,        // Reload hook failed (wraps cause)
    };

    Kind kind;
    std::string message;
    std::string component;
    std::string dependent;              // For DependentsActive
    std::shared_ptr<const Error> cause; // For wrapping kinds

    /// Configuration errors are programming or wiring mistakes, not runtime failures
    [[nodiscard]] bool is_configuration_error() const noexcept {
        switch (kind) {
            case Kind::AlreadyActive:
            case Kind::CircularDependency:
            case Kind::NoConstructionPath:
            case Kind::DependentsActive:
            case Kind::InvalidBinding:
                return true;
            default:
                return false;
        }
    }

    /// Factory methods
    [[nodiscard]] static ComponentError not_found(const std::string& component) {
        return ComponentError{Kind::NotFound,
            "Component " + component + " has not been initialized", component, {}, nullptr};
    }

    [[nodiscard]] static ComponentError already_active(const std::string& component) {
        return ComponentError{Kind::AlreadyActive,
            "Component " + component + " is already initialized", component, {}, nullptr};
    }

    [[nodiscard]] static ComponentError circular_dependency(const std::string& component, const std::string& phase) {
        return ComponentError{Kind::CircularDependency,
            "Component " + component + " is already pending " + phase + " (circular dependency?)",
            component, {}, nullptr};
    }

    [[nodiscard]] static ComponentError no_construction_path(const std::string& component) {
        return ComponentError{Kind::NoConstructionPath,
            "Component " + component + " cannot be instantiated because no compatible constructor has been found",
            component, {}, nullptr};
    }

    [[nodiscard]] static ComponentError dependents_active(const std::string& component, const std::string& dependent) {
        return ComponentError{Kind::DependentsActive,
            "Component " + component + " cannot be deinitialized because its dependent " + dependent +
            " is still active",
            component, dependent, nullptr};
    }

    [[nodiscard]] static ComponentError invalid_binding(const std::string& reason) {
        return ComponentError{Kind::InvalidBinding, "Invalid registry binding: " + reason, {}, {}, nullptr};
    }

    // Wrapping factories, defined once Error is complete
    [[nodiscard]] static ComponentError construction_failed(const std::string& component, Error cause);
    [[nodiscard]] static ComponentError teardown_failed(const std::string& component, Error cause);
    [[nodiscard]] static ComponentError reload_failed(const std::string& component, Error cause);
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ComponentError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ComponentError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Check for a specific component error kind
    [[nodiscard]] bool is(ComponentError::Kind kind) const {
        const auto* err = as<ComponentError>();
        return err && err->kind == kind;
    }

    /// Get the wrapped cause, if any
    [[nodiscard]] const Error* cause() const {
        const auto* err = as<ComponentError>();
        return err ? err->cause.get() : nullptr;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

private:
    static ErrorCode to_error_code(ComponentError::Kind kind) {
        switch (kind) {
            case ComponentError::Kind::NotFound: return ErrorCode::NotFound;
            case ComponentError::Kind::AlreadyActive: return ErrorCode::AlreadyExists;
            case ComponentError::Kind::CircularDependency: return ErrorCode::DependencyCycle;
            case ComponentError::Kind::NoConstructionPath: return ErrorCode::InvalidArgument;
            case ComponentError::Kind::DependentsActive: return ErrorCode::InvalidState;
            case ComponentError::Kind::InvalidBinding: return ErrorCode::InvalidState;
            case ComponentError::Kind::ConstructionFailed: return ErrorCode::InvalidState;
            case ComponentError::Kind::TeardownFailed: return ErrorCode::InvalidState;
            case ComponentError::Kind::ReloadFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

inline ComponentError ComponentError::construction_failed(const std::string& component, Error cause) {
    return ComponentError{Kind::ConstructionFailed,
        "Construction failed for component " + component, component, {},
        std::make_shared<const Error>(std::move(cause))};
}

inline ComponentError ComponentError::teardown_failed(const std::string& component, Error cause) {
    return ComponentError{Kind::TeardownFailed,
        "An error occurred while deinitializing component " + component, component, {},
        std::make_shared<const Error>(std::move(cause))};
}

inline ComponentError ComponentError::reload_failed(const std::string& component, Error cause) {
    return ComponentError{Kind::ReloadFailed,
        "Reload failed for component " + component, component, {},
        std::make_shared<const Error>(std::move(cause))};
}

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value or Error returned by every fallible keystone operation.
///
/// Accessing `value()` on an error result (or `error()` on a success) is undefined;
/// test with `is_ok()` / `operator bool` first.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T* operator->() { return &*m_value; }
    [[nodiscard]] const T* operator->() const { return &*m_value; }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Success-or-Error for operations without a value
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)), m_failed(true) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_failed; }
    [[nodiscard]] bool is_err() const noexcept { return m_failed; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

private:
    E m_error;
    bool m_failed = false;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message including every wrapped cause
std::string build_error_chain(const Error& error);

/// Innermost cause of a wrapped error (the error itself when nothing is wrapped)
[[nodiscard]] const Error& root_cause(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded component errors
std::uint64_t component_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace keystone_core
