#include "auth_token_manager.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <regex>
#include <spdlog/spdlog.h>

namespace rplayer {

namespace {

// One failed handshake attempt; retried by renewWithRetry
class HandshakeFailed : public std::runtime_error {
public:
    explicit HandshakeFailed(const std::string& what) : std::runtime_error(what) {}
};

std::string describe(const HttpResponse& res) {
    if (res.status == 0) {
        return "network error: " + res.error;
    }
    if (res.status == 401 || res.status == 403) {
        return "rejected (" + std::to_string(res.status) + ")";
    }
    if (res.status >= 500) {
        return "server error (" + std::to_string(res.status) + ")";
    }
    return "status " + std::to_string(res.status);
}

std::string parse_area(const std::string& body) {
    std::string head = trim(body.substr(0, body.find(',')));
    if (starts_with(head, "JP")) {
        return head;
    }
    std::smatch match;
    static const std::regex area_re("JP\\d{2}");
    if (std::regex_search(body, match, area_re)) {
        return match.str(0);
    }
    return "";
}

} // namespace

AuthTokenManager::AuthTokenManager(HttpClient& http, AuthConfig config, Clock clock, Sleeper sleeper)
    : http_(http), config_(std::move(config)), clock_(std::move(clock)), sleeper_(std::move(sleeper)) {
    if (!config_.token_override.empty()) {
        // Externally supplied credential: never expires, never renewed
        AuthToken token;
        token.value = config_.token_override;
        token.issued_at = clock_();
        token.validity = std::chrono::hours(24 * 365 * 10);
        token_ = token;
        spdlog::info("auth: using externally supplied token");
    }
}

AuthTokenManager::~AuthTokenManager() {
    stop();
}

AuthToken AuthTokenManager::getValidToken() {
    std::promise<AuthToken> promise;
    std::shared_future<AuthToken> outcome;
    bool owner = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token_ && !token_->expired(clock_(), config_.safety_margin)) {
            return *token_;
        }
        if (!inflight_.valid()) {
            inflight_ = promise.get_future().share();
            owner = true;
        }
        outcome = inflight_;
    }

    if (owner) {
        try {
            AuthToken fresh = renewWithRetry();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fresh.generation = ++generation_;
                token_ = fresh;
                inflight_ = {};
            }
            cv_.notify_all();
            promise.set_value(fresh);
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_ = {};
            }
            promise.set_exception(std::current_exception());
        }
    }

    return outcome.get();
}

void AuthTokenManager::invalidate(const std::string& token_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.token_override.empty()) {
        spdlog::warn("auth: supplied token was rejected upstream; cannot renew it");
        return;
    }
    if (token_ && token_->value == token_value) {
        spdlog::info("auth: token rejected upstream, dropping it");
        token_.reset();
    }
}

std::optional<AuthToken> AuthTokenManager::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

HeaderList AuthTokenManager::appHeaders() const {
    HeaderList headers = {
        {"Pragma", "no-cache"},
        {"Cache-Control", "no-cache"},
        {"X-Radiko-App", config_.app},
        {"X-Radiko-App-Version", config_.app_version},
        {"X-Radiko-Device", config_.device},
        {"X-Radiko-User", config_.user},
        {"Origin", "https://radiko.jp"},
        {"Referer", "https://radiko.jp/"},
    };
    if (!config_.cookie.empty()) {
        headers.emplace_back("Cookie", config_.cookie);
    }
    return headers;
}

HeaderList AuthTokenManager::streamHeaders(const AuthToken& token) const {
    HeaderList headers = {
        {"X-Radiko-App", config_.app},
        {"X-Radiko-App-Version", config_.app_version},
        {"X-Radiko-Device", config_.device},
        {"X-Radiko-User", config_.user},
        {"X-Radiko-AuthToken", token.value},
    };
    if (!token.partial_key.empty()) {
        headers.emplace_back("X-Radiko-Partialkey", token.partial_key);
    }
    if (!token.area_id.empty()) {
        headers.emplace_back("X-Radiko-AreaId", token.area_id);
    }
    return headers;
}

AuthToken AuthTokenManager::renewWithRetry() {
    std::string last_error;
    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        try {
            AuthToken token = handshake();
            spdlog::info("auth: token acquired (area {})", token.area_id.empty() ? "?" : token.area_id);
            return token;
        } catch (const HandshakeFailed& e) {
            last_error = e.what();
            spdlog::warn("auth: handshake attempt {}/{} failed: {}", attempt, config_.max_attempts, last_error);
        }
        if (attempt < config_.max_attempts) {
            sleeper_(config_.backoff * (1 << (attempt - 1)));
        }
    }
    throw AuthUnavailable("authentication unavailable: " + last_error);
}

AuthToken AuthTokenManager::handshake() {
    ++handshake_count_;
    HeaderList headers = appHeaders();

    // Step 1: challenge
    std::string token;
    std::string key_length;
    std::string key_offset;
    std::string failure = "no auth1 endpoint answered";
    for (const auto& url : config_.auth1_urls) {
        HttpResponse res = http_.get(url, headers);
        token = res.header("X-Radiko-AuthToken");
        key_length = res.header("X-Radiko-KeyLength");
        key_offset = res.header("X-Radiko-KeyOffset");
        if (!token.empty() && !key_length.empty() && !key_offset.empty()) {
            spdlog::debug("auth: auth1 ok ({})", url);
            break;
        }
        failure = "auth1 " + describe(res) + " at " + url;
        if (res.ok()) {
            failure = "auth1 challenge missing headers at " + url;
            if (res.body.find("<html") != std::string::npos || res.body.find("<!DOCTYPE html") != std::string::npos) {
                failure += " (HTML reply, likely blocked or redirected)";
            }
        }
        spdlog::debug("auth: {}", failure);
    }
    if (token.empty() || key_length.empty() || key_offset.empty()) {
        throw HandshakeFailed(failure);
    }

    // Partial key: slice of the app key selected by the challenge
    size_t offset = 0;
    size_t length = 0;
    try {
        offset = std::stoul(key_offset);
        length = std::stoul(key_length);
    } catch (const std::logic_error&) {
        throw HandshakeFailed("malformed challenge: offset '" + key_offset + "' length '" + key_length + "'");
    }
    if (length == 0 || offset + length > config_.authkey.size()) {
        throw HandshakeFailed("malformed challenge: slice [" + key_offset + ", +" + key_length + ") outside key");
    }
    std::string partial = base64_encode(config_.authkey.substr(offset, length));

    // Step 2: confirmation
    HeaderList confirm = headers;
    confirm.emplace_back("X-Radiko-AuthToken", token);
    confirm.emplace_back("X-Radiko-Partialkey", partial);

    HttpResponse res2;
    failure = "no auth2 endpoint answered";
    for (const auto& url : config_.auth2_urls) {
        res2 = http_.post(url, "\r\n", confirm);
        if (res2.status == 404 || res2.status == 405) {
            res2 = http_.get(url, confirm);
        }
        if (res2.ok()) {
            spdlog::debug("auth: auth2 ok ({})", url);
            break;
        }
        failure = "auth2 " + describe(res2) + " at " + url;
        spdlog::debug("auth: {}", failure);
    }
    if (!res2.ok()) {
        throw HandshakeFailed(failure);
    }

    AuthToken result;
    result.value = token;
    result.partial_key = partial;
    result.area_id = parse_area(res2.body);
    result.issued_at = clock_();
    result.validity = config_.token_ttl;
    return result;
}

void AuthTokenManager::startBackgroundRenewal() {
    if (!config_.token_override.empty()) {
        return;
    }
    if (!running_.exchange(true)) {
        renewal_ = std::thread(&AuthTokenManager::renewalThread, this);
    }
}

void AuthTokenManager::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        }
        if (renewal_.joinable()) {
            renewal_.join();
        }
    }
}

void AuthTokenManager::renewalThread() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Nothing to renew until someone has asked for a token
            cv_.wait(lock, [this] { return !running_ || token_.has_value(); });
            if (!running_) {
                break;
            }
            auto renew_at = token_->expires_at() - config_.safety_margin;
            auto wait = renew_at - clock_();
            if (wait > std::chrono::system_clock::duration::zero()) {
                uint64_t seen = token_->generation;
                cv_.wait_for(lock, wait, [this, seen] {
                    return !running_ || !token_ || token_->generation != seen;
                });
                continue;
            }
        }

        try {
            getValidToken();
        } catch (const AuthUnavailable& e) {
            spdlog::warn("auth: background renewal failed: {}", e.what());
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, RENEWAL_RETRY, [this] { return !running_; });
        }
    }
}

} // namespace rplayer
