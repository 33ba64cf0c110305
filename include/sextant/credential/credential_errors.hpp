#pragma once

#include <system_error>

namespace sextant::credential {

enum class CredentialErrc {
    Success = 0,
    StoreUnavailable,
    PromptCancelled,
    InvalidCredential
};

const std::error_category& credential_error_category() noexcept;
std::error_code make_error_code(CredentialErrc value) noexcept;

}  // namespace sextant::credential

namespace std {

template <>
struct is_error_code_enum<sextant::credential::CredentialErrc> : true_type {
};

}  // namespace std
