#pragma once

#include <string>
#include <system_error>

namespace sextant::backend {

enum class ConnectionErrc {
    Success = 0,
    Timeout,
    AuthFailed,
    NetworkUnreachable,
    Unsupported,
    InvalidProfile,
    Closed
};

enum class CatalogErrc {
    Success = 0,
    PermissionDenied,
    NotFound,
    Failed
};

enum class QueryErrc {
    Success = 0,
    SyntaxError,
    RuntimeError,
    Cancelled
};

const std::error_category& connection_error_category() noexcept;
const std::error_category& catalog_error_category() noexcept;
const std::error_category& query_error_category() noexcept;

std::error_code make_error_code(ConnectionErrc value) noexcept;
std::error_code make_error_code(CatalogErrc value) noexcept;
std::error_code make_error_code(QueryErrc value) noexcept;

// How every backend failure travels: the taxonomy code, the server or library
// message, and the SQLSTATE when the server reported one.
struct BackendError final {
    std::error_code code{};
    std::string message{};
    std::string sqlstate{};

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(code); }
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] BackendError make_backend_error(std::error_code code, std::string message = {}, std::string sqlstate = {});

[[nodiscard]] bool is_cancellation(const BackendError& error) noexcept;

}  // namespace sextant::backend

namespace std {

template <>
struct is_error_code_enum<sextant::backend::ConnectionErrc> : true_type {
};

template <>
struct is_error_code_enum<sextant::backend::CatalogErrc> : true_type {
};

template <>
struct is_error_code_enum<sextant::backend::QueryErrc> : true_type {
};

}  // namespace std
