#pragma once

#include "sextant/backend/backend.hpp"
#include "sextant/credential/credential_errors.hpp"
#include "sextant/credential/credential_store.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace sextant::credential {

enum class PromptReason : std::uint8_t {
    NotStored = 0,
    AskEveryTime,
    StoreUnavailable
};

enum class ResolutionState : std::uint8_t {
    NotResolved = 0,
    ResolvedFromStore,
    ResolvedFromPrompt,
    Failed
};

[[nodiscard]] std::string_view to_string(PromptReason reason) noexcept;
[[nodiscard]] std::string_view to_string(ResolutionState state) noexcept;

struct CredentialResolution final {
    ResolutionState state = ResolutionState::NotResolved;
    backend::Credentials credentials{};
    std::error_code error{};
    bool store_unavailable = false;

    [[nodiscard]] bool resolved() const noexcept
    {
        return state == ResolutionState::ResolvedFromStore || state == ResolutionState::ResolvedFromPrompt;
    }
};

// Produces the secret for a profile according to its credential policy and
// applies the policy's persistence rule after the connect attempt. Calls are
// serialized, so a profile is never resolved twice at the same time.
class CredentialResolver final {
public:
    // Returns the entered secret, or nullopt when the user cancelled.
    using Prompt = std::function<std::optional<std::string>(const backend::ConnectionProfile&, PromptReason)>;

    CredentialResolver(CredentialStore* store, Prompt prompt);

    [[nodiscard]] CredentialResolution resolve(const backend::ConnectionProfile& profile);

    // Store failures here are reported but do not undo the connect.
    [[nodiscard]] std::error_code on_connect_succeeded(const backend::ConnectionProfile& profile,
                                                       const CredentialResolution& resolution);

    // Marks the resolution failed. An authentication failure yields
    // InvalidCredential and drops a stored secret so the next attempt prompts.
    [[nodiscard]] std::error_code on_connect_failed(const backend::ConnectionProfile& profile,
                                                    CredentialResolution& resolution,
                                                    const backend::BackendError& error);

    [[nodiscard]] std::error_code forget(const backend::ConnectionProfile& profile);

private:
    CredentialStore* store_ = nullptr;
    Prompt prompt_{};
    std::mutex mutex_{};
};

}  // namespace sextant::credential
