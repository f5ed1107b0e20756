#ifndef AUTH_TOKEN_MANAGER_HPP
#define AUTH_TOKEN_MANAGER_HPP

#include "config.hpp"
#include "http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace rplayer {

// Session credential for the streaming service
struct AuthToken {
    std::string value;
    std::string partial_key;
    std::string area_id;  // e.g. "JP13", empty if the service did not say
    std::chrono::system_clock::time_point issued_at;
    std::chrono::seconds validity{0};
    uint64_t generation = 0;  // advances with every completed handshake

    std::chrono::system_clock::time_point expires_at() const { return issued_at + validity; }

    // Expired once now + margin reaches the end of the validity window
    bool expired(std::chrono::system_clock::time_point now, std::chrono::seconds margin) const {
        return now + margin >= expires_at();
    }
};

// Acquires, caches and renews the upstream token. Renewal is single-flight:
// callers that arrive while a handshake is running wait for its outcome.
class AuthTokenManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    AuthTokenManager(HttpClient& http, AuthConfig config,
                     Clock clock = [] { return std::chrono::system_clock::now(); },
                     Sleeper sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); });
    ~AuthTokenManager();

    AuthTokenManager(const AuthTokenManager&) = delete;
    AuthTokenManager& operator=(const AuthTokenManager&) = delete;

    // Token unexpired at return time. Throws AuthUnavailable once the
    // handshake has failed max_attempts times in a row.
    AuthToken getValidToken();

    // Upstream rejected this token; drop it so the next caller renews
    void invalidate(const std::string& token_value);

    // Request headers the playback backend must attach for this token
    HeaderList streamHeaders(const AuthToken& token) const;

    // Headers identifying the app to the service (no token)
    HeaderList appHeaders() const;

    std::optional<AuthToken> cached() const;

    // Number of handshake attempts issued so far
    int handshakeCount() const { return handshake_count_; }

    // Renew shortly before expiry on a background thread
    void startBackgroundRenewal();
    void stop();

private:
    AuthToken renewWithRetry();
    AuthToken handshake();
    void renewalThread();

    HttpClient& http_;
    AuthConfig config_;
    Clock clock_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<AuthToken> token_;
    std::shared_future<AuthToken> inflight_;
    uint64_t generation_ = 0;

    std::atomic<int> handshake_count_{0};
    std::atomic<bool> running_{false};
    std::thread renewal_;

    static constexpr auto RENEWAL_RETRY = std::chrono::seconds(30);
};

} // namespace rplayer

#endif // AUTH_TOKEN_MANAGER_HPP
