#include "sextant/backend/backend_errors.hpp"

#include <utility>

namespace sextant::backend {

namespace {

class ConnectionErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sextant.connection";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ConnectionErrc>(condition)) {
        case ConnectionErrc::Success:
            return "success";
        case ConnectionErrc::Timeout:
            return "connection timed out";
        case ConnectionErrc::AuthFailed:
            return "authentication failed";
        case ConnectionErrc::NetworkUnreachable:
            return "server unreachable";
        case ConnectionErrc::Unsupported:
            return "unsupported connection target";
        case ConnectionErrc::InvalidProfile:
            return "invalid connection profile";
        case ConnectionErrc::Closed:
            return "connection closed";
        default:
            return "unknown connection error";
        }
    }
};

class CatalogErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sextant.catalog";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CatalogErrc>(condition)) {
        case CatalogErrc::Success:
            return "success";
        case CatalogErrc::PermissionDenied:
            return "permission denied";
        case CatalogErrc::NotFound:
            return "catalog object not found";
        case CatalogErrc::Failed:
            return "catalog request failed";
        default:
            return "unknown catalog error";
        }
    }
};

class QueryErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sextant.query";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<QueryErrc>(condition)) {
        case QueryErrc::Success:
            return "success";
        case QueryErrc::SyntaxError:
            return "syntax error";
        case QueryErrc::RuntimeError:
            return "query failed";
        case QueryErrc::Cancelled:
            return "query cancelled";
        default:
            return "unknown query error";
        }
    }
};

const ConnectionErrorCategory kConnectionCategory{};
const CatalogErrorCategory kCatalogCategory{};
const QueryErrorCategory kQueryCategory{};

}  // namespace

const std::error_category& connection_error_category() noexcept
{
    return kConnectionCategory;
}

const std::error_category& catalog_error_category() noexcept
{
    return kCatalogCategory;
}

const std::error_category& query_error_category() noexcept
{
    return kQueryCategory;
}

std::error_code make_error_code(ConnectionErrc value) noexcept
{
    return {static_cast<int>(value), connection_error_category()};
}

std::error_code make_error_code(CatalogErrc value) noexcept
{
    return {static_cast<int>(value), catalog_error_category()};
}

std::error_code make_error_code(QueryErrc value) noexcept
{
    return {static_cast<int>(value), query_error_category()};
}

std::string BackendError::describe() const
{
    if (!code) {
        return "success";
    }
    std::string text = code.message();
    if (!message.empty()) {
        text += ": ";
        text += message;
    }
    if (!sqlstate.empty()) {
        text += " (SQLSTATE " + sqlstate + ")";
    }
    return text;
}

BackendError make_backend_error(std::error_code code, std::string message, std::string sqlstate)
{
    BackendError error{};
    error.code = code;
    error.message = std::move(message);
    error.sqlstate = std::move(sqlstate);
    return error;
}

bool is_cancellation(const BackendError& error) noexcept
{
    return error.code == QueryErrc::Cancelled;
}

}  // namespace sextant::backend
