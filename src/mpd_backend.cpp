#include "mpd_backend.hpp"
#include "errors.hpp"
#include "text_util.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace rplayer {

namespace {

// Closes the socket on every exit path
class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

int connect_to(const std::string& host, int port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw PlaybackBackendError("mpd: cannot resolve " + host + ": " + gai_strerror(rc));
    }

    int fd = -1;
    for (addrinfo* ai = result; ai; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        throw PlaybackBackendError("mpd: cannot connect to " + host + ":" + service);
    }
    return fd;
}

// Last complete line of a reply, empty if the reply does not end in '\n'
std::string last_line(const std::string& reply) {
    if (reply.empty() || reply.back() != '\n') {
        return "";
    }
    size_t start = reply.size() >= 2 ? reply.rfind('\n', reply.size() - 2) : std::string::npos;
    return reply.substr(start == std::string::npos ? 0 : start + 1);
}

// Read until a line starting with "OK" or "ACK" terminates the reply
std::string read_reply(int fd) {
    std::string reply;
    char buf[1024];
    while (true) {
        std::string last = last_line(reply);
        if (starts_with(last, "OK") || starts_with(last, "ACK")) {
            return reply;
        }
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            throw PlaybackBackendError(std::string("mpd: connection lost: ") +
                                       (n == 0 ? "closed by server" : std::strerror(errno)));
        }
        reply.append(buf, static_cast<size_t>(n));
    }
}

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            throw PlaybackBackendError(std::string("mpd: send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace

MpdBackend::MpdBackend(std::string host, int port) : host_(std::move(host)), port_(port) {}

std::string MpdBackend::quote(const std::string& arg) {
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::map<std::string, std::string> MpdBackend::parse_pairs(const std::string& reply) {
    std::map<std::string, std::string> pairs;
    std::istringstream lines(reply);
    std::string line;
    while (std::getline(lines, line)) {
        size_t colon = line.find(": ");
        if (colon == std::string::npos) continue;
        pairs[line.substr(0, colon)] = trim(line.substr(colon + 2));
    }
    return pairs;
}

std::string MpdBackend::run(const std::vector<std::string>& commands) {
    Socket sock(connect_to(host_, port_, IO_TIMEOUT_MS));
    std::string greeting = read_reply(sock.fd());
    if (!starts_with(greeting, "OK MPD")) {
        throw PlaybackBackendError("mpd: unexpected greeting '" + trim(greeting) + "'");
    }

    std::string replies;
    for (const auto& command : commands) {
        send_all(sock.fd(), command + "\n");
        std::string reply = read_reply(sock.fd());
        if (starts_with(last_line(reply), "ACK")) {
            throw PlaybackBackendError("mpd: '" + command + "' failed: " + trim(reply));
        }
        replies += reply;
    }
    return replies;
}

bool MpdBackend::available() {
    try {
        run({"ping"});
        return true;
    } catch (const PlaybackBackendError& e) {
        spdlog::debug("{}", e.what());
        return false;
    }
}

void MpdBackend::start(const StreamRef& stream) {
    if (stream.needs_headers()) {
        spdlog::warn("mpd: dropping {} request headers for {}", stream.headers.size(), stream.url);
    }
    run({"clear", "add " + quote(stream.url), "play"});
    spdlog::info("mpd: playing {}", stream.url);
}

void MpdBackend::stop() {
    try {
        run({"stop", "clear"});
    } catch (const PlaybackBackendError& e) {
        spdlog::warn("{}", e.what());
    }
}

BackendStatus MpdBackend::status() {
    try {
        auto pairs = parse_pairs(run({"status"}));
        return pairs["state"] == "play" ? BackendStatus::Running : BackendStatus::Stopped;
    } catch (const PlaybackBackendError& e) {
        spdlog::debug("{}", e.what());
        return BackendStatus::Stopped;
    }
}

std::string MpdBackend::stream_title() {
    try {
        auto pairs = parse_pairs(run({"currentsong"}));
        for (const char* key : {"Title", "Name"}) {
            if (!pairs[key].empty()) return pairs[key];
        }
    } catch (const PlaybackBackendError& e) {
        spdlog::debug("{}", e.what());
    }
    return "";
}

} // namespace rplayer
