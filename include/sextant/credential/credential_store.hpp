#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>

namespace sextant::credential {

// Secret storage keyed by profile id. A missing secret is not an error: get
// succeeds and leaves the secret empty.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    [[nodiscard]] virtual std::error_code get(const std::string& profile_id, std::optional<std::string>& secret) = 0;
    [[nodiscard]] virtual std::error_code set(const std::string& profile_id, const std::string& secret) = 0;
    [[nodiscard]] virtual std::error_code erase(const std::string& profile_id) = 0;
};

class InMemoryCredentialStore final : public CredentialStore {
public:
    [[nodiscard]] std::error_code get(const std::string& profile_id, std::optional<std::string>& secret) override;
    [[nodiscard]] std::error_code set(const std::string& profile_id, const std::string& secret) override;
    [[nodiscard]] std::error_code erase(const std::string& profile_id) override;

    // While unavailable every call fails with StoreUnavailable.
    void set_available(bool available) noexcept;

    [[nodiscard]] bool contains(const std::string& profile_id) const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, std::string> secrets_{};
    std::atomic<bool> available_{true};
};

}  // namespace sextant::credential
