/// @file error.cpp
/// @brief Error handling implementation for keystone_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error chain formatting
/// - Error statistics

#include <keystone/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace keystone_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* component_error_kind_name(ComponentError::Kind kind) {
    switch (kind) {
        case ComponentError::Kind::NotFound: return "NotFound";
        case ComponentError::Kind::AlreadyActive: return "AlreadyActive";
        case ComponentError::Kind::CircularDependency: return "CircularDependency";
        case ComponentError::Kind::NoConstructionPath: return "NoConstructionPath";
        case ComponentError::Kind::DependentsActive: return "DependentsActive";
        case ComponentError::Kind::InvalidBinding: return "InvalidBinding";
        case ComponentError::Kind::ConstructionFailed: return "ConstructionFailed";
        case ComponentError::Kind::TeardownFailed: return "TeardownFailed";
        case ComponentError::Kind::ReloadFailed: return "ReloadFailed";
        default: return "Unknown";
    }
}

/// Format component error with full context (cause excluded)
std::string format_component_error(const ComponentError& err) {
    std::ostringstream oss;
    oss << "[ComponentError:" << component_error_kind_name(err.kind) << "] " << err.message;

    if (!err.component.empty()) {
        oss << " (component: " << err.component << ")";
    }
    if (!err.dependent.empty()) {
        oss << " (dependent: " << err.dependent << ")";
    }

    return oss.str();
}

void append_error(std::ostringstream& oss, const Error& error) {
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ComponentError>) {
            oss << format_component_error(err);
        }
    }, error.variant());
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message including every wrapped cause
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    detail::append_error(oss, error);

    for (const Error* cause = error.cause(); cause != nullptr; cause = cause->cause()) {
        oss << "\n  caused by: ";
        detail::append_error(oss, *cause);
    }

    return oss.str();
}

const Error& root_cause(const Error& error) {
    const Error* current = &error;
    while (const Error* next = current->cause()) {
        current = next;
    }
    return *current;
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> component_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ComponentError>()) {
        s_error_stats.component_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t component_error_count() {
    return s_error_stats.component_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.component_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Component: " << s_error_stats.component_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace keystone_core
