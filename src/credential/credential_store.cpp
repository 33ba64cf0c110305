#include "sextant/credential/credential_store.hpp"

#include "sextant/credential/credential_errors.hpp"

namespace sextant::credential {

std::error_code InMemoryCredentialStore::get(const std::string& profile_id, std::optional<std::string>& secret)
{
    if (!available_.load(std::memory_order_acquire)) {
        return make_error_code(CredentialErrc::StoreUnavailable);
    }

    std::lock_guard guard{mutex_};
    const auto found = secrets_.find(profile_id);
    if (found == secrets_.end()) {
        secret.reset();
    } else {
        secret = found->second;
    }
    return {};
}

std::error_code InMemoryCredentialStore::set(const std::string& profile_id, const std::string& secret)
{
    if (!available_.load(std::memory_order_acquire)) {
        return make_error_code(CredentialErrc::StoreUnavailable);
    }

    std::lock_guard guard{mutex_};
    secrets_[profile_id] = secret;
    return {};
}

std::error_code InMemoryCredentialStore::erase(const std::string& profile_id)
{
    if (!available_.load(std::memory_order_acquire)) {
        return make_error_code(CredentialErrc::StoreUnavailable);
    }

    std::lock_guard guard{mutex_};
    secrets_.erase(profile_id);
    return {};
}

void InMemoryCredentialStore::set_available(bool available) noexcept
{
    available_.store(available, std::memory_order_release);
}

bool InMemoryCredentialStore::contains(const std::string& profile_id) const
{
    std::lock_guard guard{mutex_};
    return secrets_.find(profile_id) != secrets_.end();
}

std::size_t InMemoryCredentialStore::size() const
{
    std::lock_guard guard{mutex_};
    return secrets_.size();
}

}  // namespace sextant::credential
