#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rplayer {

// Base for every failure the player reports
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Upstream auth handshake exhausted its retries
class AuthUnavailable : public Error {
public:
    explicit AuthUnavailable(const std::string& what) : Error(what) {}
};

// Stream lookup failed for a station without a fixed URL
class StationUnresolvable : public Error {
public:
    explicit StationUnresolvable(const std::string& what) : Error(what) {}
};

// Upstream does not know the station (e.g. outside the service area)
class StationNotFound : public Error {
public:
    explicit StationNotFound(const std::string& what) : Error(what) {}
};

class MetadataUnavailable : public Error {
public:
    explicit MetadataUnavailable(const std::string& what) : Error(what) {}
};

class PersistenceError : public Error {
public:
    explicit PersistenceError(const std::string& what) : Error(what) {}
};

class PlaybackBackendError : public Error {
public:
    explicit PlaybackBackendError(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace rplayer

#endif // ERRORS_HPP
