#include "sextant/credential/credential_errors.hpp"

#include <string>

namespace sextant::credential {

namespace {

class CredentialErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sextant.credential";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CredentialErrc>(condition)) {
        case CredentialErrc::Success:
            return "success";
        case CredentialErrc::StoreUnavailable:
            return "credential store unavailable";
        case CredentialErrc::PromptCancelled:
            return "password prompt cancelled";
        case CredentialErrc::InvalidCredential:
            return "invalid credential";
        default:
            return "unknown credential error";
        }
    }
};

const CredentialErrorCategory kCategory{};

}  // namespace

const std::error_category& credential_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CredentialErrc value) noexcept
{
    return {static_cast<int>(value), credential_error_category()};
}

}  // namespace sextant::credential
