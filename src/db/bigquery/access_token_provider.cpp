#include "db/bigquery/access_token_provider.hpp"
#include "core/base64.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <httplib.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <format>
#include <fstream>
#include <sstream>
#include <vector>

namespace dpgw {

namespace {

constexpr auto kRefreshMargin = std::chrono::seconds{60};
constexpr auto kAssertionLifetime = std::chrono::seconds{3600};

// "https://host[:port]/path" -> {"https://host[:port]", "/path"}
std::pair<std::string, std::string> split_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    const auto path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

std::string sign_rs256(const std::string& pem_key, const std::string& input) {
    BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
    if (!bio) return {};
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!key) {
        utils::log::error("BigQuery auth: service account private key is not a valid PEM key");
        return {};
    }

    std::string signature;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    size_t sig_len = 0;
    if (ctx &&
        EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key) == 1 &&
        EVP_DigestSignUpdate(ctx, input.data(), input.size()) == 1 &&
        EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
        std::vector<unsigned char> buffer(sig_len);
        if (EVP_DigestSignFinal(ctx, buffer.data(), &sig_len) == 1) {
            signature.assign(reinterpret_cast<const char*>(buffer.data()), sig_len);
        }
    }
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(key);

    if (signature.empty()) {
        utils::log::error("BigQuery auth: RS256 signing failed");
    }
    return signature;
}

} // anonymous namespace

std::unique_ptr<AccessTokenProvider> AccessTokenProvider::from_static_token(std::string token) {
    std::unique_ptr<AccessTokenProvider> provider(new AccessTokenProvider());
    provider->token_ = std::move(token);
    provider->refresh_at_ = std::chrono::steady_clock::time_point::max();
    return provider;
}

std::unique_ptr<AccessTokenProvider> AccessTokenProvider::from_service_account(ServiceAccount account) {
    std::unique_ptr<AccessTokenProvider> provider(new AccessTokenProvider());
    provider->account_ = std::move(account);
    return provider;
}

std::optional<AccessTokenProvider::ServiceAccount> AccessTokenProvider::load_service_account(
    const std::string& path) {

    std::ifstream in(path);
    if (!in) {
        utils::log::error(std::format("BigQuery auth: cannot open credentials file '{}'", path));
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        const auto doc = JsonValue::parse(buffer.str());
        ServiceAccount account;
        account.client_email = doc.string_or("client_email", "");
        account.private_key = doc.string_or("private_key", "");
        account.token_uri = doc.string_or("token_uri", account.token_uri);
        if (account.client_email.empty() || account.private_key.empty()) {
            utils::log::error(std::format(
                "BigQuery auth: '{}' lacks client_email or private_key", path));
            return std::nullopt;
        }
        return account;
    } catch (const JsonValue::parse_error& e) {
        utils::log::error(std::format("BigQuery auth: '{}': {}", path, e.what()));
        return std::nullopt;
    }
}

std::string AccessTokenProvider::build_assertion(
    const ServiceAccount& account,
    std::chrono::system_clock::time_point now) {

    const auto iat = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    const auto exp = iat + kAssertionLifetime.count();

    const std::string header = R"({"alg":"RS256","typ":"JWT"})";
    const std::string claims = std::format(
        R"({{"iss":"{}","scope":"{}","aud":"{}","iat":{},"exp":{}}})",
        utils::escape_json(account.client_email), kBigQueryScope,
        utils::escape_json(account.token_uri), iat, exp);

    const std::string signing_input = base64::encode_url(header) + "." + base64::encode_url(claims);
    const std::string signature = sign_rs256(account.private_key, signing_input);
    if (signature.empty()) {
        return {};
    }
    return signing_input + "." + base64::encode_url(signature);
}

bool AccessTokenProvider::exchange_locked() {
    const std::string assertion = build_assertion(*account_, std::chrono::system_clock::now());
    if (assertion.empty()) {
        return false;
    }

    const auto [base, path] = split_url(account_->token_uri);
    httplib::Client cli(base);
    cli.set_connection_timeout(std::chrono::seconds{10});
    cli.set_read_timeout(std::chrono::seconds{30});

    const std::string body =
        "grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Ajwt-bearer&assertion=" + assertion;
    const auto res = cli.Post(path, body, "application/x-www-form-urlencoded");
    if (!res) {
        utils::log::error(std::format("BigQuery auth: token request failed: {}",
                                      httplib::to_string(res.error())));
        return false;
    }
    if (res->status != httplib::StatusCode::OK_200) {
        utils::log::error(std::format("BigQuery auth: token endpoint returned HTTP {}: {}",
                                      res->status, res->body));
        return false;
    }

    try {
        const auto doc = JsonValue::parse(res->body);
        auto token = doc.optional_string("access_token");
        if (!token) {
            utils::log::error("BigQuery auth: token response has no access_token");
            return false;
        }
        const auto expires_in = std::chrono::seconds{doc.int_or("expires_in", 3600)};
        token_ = std::move(*token);
        refresh_at_ = std::chrono::steady_clock::now() + expires_in - kRefreshMargin;
        utils::log::debug(std::format("BigQuery auth: token obtained for {} (expires in {}s)",
                                      account_->client_email, expires_in.count()));
        return true;
    } catch (const JsonValue::parse_error& e) {
        utils::log::error(std::format("BigQuery auth: {}", e.what()));
        return false;
    }
}

std::optional<std::string> AccessTokenProvider::token() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!token_.empty() && std::chrono::steady_clock::now() < refresh_at_) {
        return token_;
    }
    if (!account_) {
        // Static token configured but empty
        return token_.empty() ? std::nullopt : std::optional<std::string>(token_);
    }
    if (!exchange_locked()) {
        return std::nullopt;
    }
    return token_;
}

} // namespace dpgw
