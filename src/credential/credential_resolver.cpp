#include "sextant/credential/credential_resolver.hpp"

#include <utility>

namespace sextant::credential {

std::string_view to_string(PromptReason reason) noexcept
{
    switch (reason) {
    case PromptReason::NotStored:
        return "no stored password";
    case PromptReason::AskEveryTime:
        return "password required for every connect";
    case PromptReason::StoreUnavailable:
        return "credential store unavailable";
    default:
        return "password required";
    }
}

std::string_view to_string(ResolutionState state) noexcept
{
    switch (state) {
    case ResolutionState::NotResolved:
        return "not-resolved";
    case ResolutionState::ResolvedFromStore:
        return "resolved-from-store";
    case ResolutionState::ResolvedFromPrompt:
        return "resolved-from-prompt";
    case ResolutionState::Failed:
        return "failed";
    default:
        return "unknown";
    }
}

CredentialResolver::CredentialResolver(CredentialStore* store, Prompt prompt)
    : store_{store}
    , prompt_{std::move(prompt)}
{
}

CredentialResolution CredentialResolver::resolve(const backend::ConnectionProfile& profile)
{
    std::lock_guard guard{mutex_};

    CredentialResolution resolution{};
    resolution.credentials.username = profile.username;

    auto reason = PromptReason::AskEveryTime;
    if (profile.credential_policy == backend::CredentialPolicy::Store) {
        reason = PromptReason::NotStored;
        std::optional<std::string> stored;
        if (store_ == nullptr || store_->get(profile.id, stored)) {
            resolution.store_unavailable = true;
            reason = PromptReason::StoreUnavailable;
        } else if (stored) {
            resolution.state = ResolutionState::ResolvedFromStore;
            resolution.credentials.secret = std::move(*stored);
            return resolution;
        }
    }

    std::optional<std::string> entered;
    if (prompt_) {
        entered = prompt_(profile, reason);
    }
    if (!entered) {
        resolution.state = ResolutionState::Failed;
        resolution.error = make_error_code(CredentialErrc::PromptCancelled);
        return resolution;
    }

    resolution.state = ResolutionState::ResolvedFromPrompt;
    resolution.credentials.secret = std::move(*entered);
    return resolution;
}

std::error_code CredentialResolver::on_connect_succeeded(const backend::ConnectionProfile& profile,
                                                         const CredentialResolution& resolution)
{
    std::lock_guard guard{mutex_};

    switch (profile.credential_policy) {
    case backend::CredentialPolicy::Store:
        if (resolution.state != ResolutionState::ResolvedFromPrompt) {
            return {};
        }
        if (store_ == nullptr) {
            return make_error_code(CredentialErrc::StoreUnavailable);
        }
        return store_->set(profile.id, resolution.credentials.secret);
    case backend::CredentialPolicy::NeverSave:
        // A secret left behind by an earlier policy must not outlive this connect.
        if (store_ == nullptr) {
            return {};
        }
        return store_->erase(profile.id);
    case backend::CredentialPolicy::PromptAlways:
    default:
        return {};
    }
}

std::error_code CredentialResolver::on_connect_failed(const backend::ConnectionProfile& profile,
                                                      CredentialResolution& resolution,
                                                      const backend::BackendError& error)
{
    std::lock_guard guard{mutex_};

    resolution.state = ResolutionState::Failed;
    if (error.code != backend::ConnectionErrc::AuthFailed) {
        resolution.error = error.code;
        return {};
    }

    resolution.error = make_error_code(CredentialErrc::InvalidCredential);
    if (store_ != nullptr && profile.credential_policy == backend::CredentialPolicy::Store) {
        if (store_->erase(profile.id)) {
            resolution.store_unavailable = true;
        }
    }
    return resolution.error;
}

std::error_code CredentialResolver::forget(const backend::ConnectionProfile& profile)
{
    std::lock_guard guard{mutex_};
    if (store_ == nullptr) {
        return make_error_code(CredentialErrc::StoreUnavailable);
    }
    return store_->erase(profile.id);
}

}  // namespace sextant::credential
