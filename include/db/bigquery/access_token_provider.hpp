#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dpgw {

/**
 * @brief OAuth2 bearer tokens for the warehouse REST API
 *
 * Either a fixed token from configuration, or a service account whose key
 * signs an RS256 JWT assertion exchanged at token_uri. Exchanged tokens are
 * cached until 60s before they expire. Thread-safe.
 */
class AccessTokenProvider {
public:
    struct ServiceAccount {
        std::string client_email;
        std::string private_key;        // PEM
        std::string token_uri = "https://oauth2.googleapis.com/token";
    };

    static constexpr const char* kBigQueryScope = "https://www.googleapis.com/auth/bigquery";

    /** @brief Fixed token; never refreshed */
    [[nodiscard]] static std::unique_ptr<AccessTokenProvider> from_static_token(std::string token);

    /** @brief Service account key file (JSON with client_email, private_key, token_uri) */
    [[nodiscard]] static std::optional<ServiceAccount> load_service_account(const std::string& path);

    [[nodiscard]] static std::unique_ptr<AccessTokenProvider> from_service_account(ServiceAccount account);

    AccessTokenProvider(const AccessTokenProvider&) = delete;
    AccessTokenProvider& operator=(const AccessTokenProvider&) = delete;

    /** @brief Current token, refreshed when needed; nullopt on failure (logged) */
    [[nodiscard]] std::optional<std::string> token();

    /**
     * @brief Signed "header.claims.signature" assertion
     * @return empty string when the key cannot be loaded or signing fails
     */
    [[nodiscard]] static std::string build_assertion(
        const ServiceAccount& account,
        std::chrono::system_clock::time_point now);

private:
    AccessTokenProvider() = default;

    [[nodiscard]] bool exchange_locked();

    std::mutex mutex_;
    std::optional<ServiceAccount> account_;
    std::string token_;
    std::chrono::steady_clock::time_point refresh_at_{};
};

} // namespace dpgw
