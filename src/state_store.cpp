#include "state_store.hpp"

#include "errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace rplayer {

namespace {

std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

bool PersistedSession::operator==(const PersistedSession& other) const {
    auto same_world = [](const std::optional<StationDescriptor>& a, const std::optional<StationDescriptor>& b) {
        if (a.has_value() != b.has_value()) return false;
        if (!a) return true;
        return a->id == b->id && a->name == b->name && a->stream_url == b->stream_url &&
               a->image_url == b->image_url;
    };
    return mode == other.mode && station_id == other.station_id && same_world(world_station, other.world_station);
}

JsonStateStore::JsonStateStore(std::string path)
    : path_(std::move(path)) {}

std::optional<PersistedSession> JsonStateStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw PersistenceError("cannot open " + path_ + ": " + std::strerror(errno));
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw PersistenceError(path_ + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) {
        throw PersistenceError(path_ + " does not hold an object");
    }

    PersistedSession session;
    std::string mode = string_or_empty(j, "mode");
    if (!mode.empty()) {
        auto parsed = parse_mode(mode);
        if (!parsed) {
            throw PersistenceError(path_ + ": unknown mode '" + mode + "'");
        }
        session.mode = *parsed;
    }
    session.station_id = string_or_empty(j, "station_id");

    std::string world_url = string_or_empty(j, "world_url");
    if (!world_url.empty()) {
        StationDescriptor world;
        world.name = string_or_empty(j, "world_name");
        world.stream_url = world_url;
        world.image_url = string_or_empty(j, "world_image_url");
        world.id = session.mode == Mode::World && !session.station_id.empty()
            ? session.station_id : (world.name.empty() ? world_url : world.name);
        world.source = Mode::World;
        session.world_station = world;
    }

    spdlog::debug("state: loaded mode={} station={}", mode_name(session.mode), session.station_id);
    return session;
}

void JsonStateStore::save(const PersistedSession& session) {
    json j = {
        {"mode", mode_name(session.mode)},
        {"station_id", session.station_id},
    };
    if (session.world_station) {
        j["world_name"] = session.world_station->name;
        j["world_url"] = session.world_station->stream_url;
        j["world_image_url"] = session.world_station->image_url;
    }

    std::string text;
    try {
        text = j.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw PersistenceError(std::string("cannot serialise state: ") + e.what());
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("cannot write " + tmp + ": " + std::strerror(errno));
        }
        file << text << '\n';
        file.flush();
        if (!file.good()) {
            throw PersistenceError("short write to " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        int err = errno;
        std::remove(tmp.c_str());
        throw PersistenceError("cannot replace " + path_ + ": " + std::strerror(err));
    }
    spdlog::debug("state: saved mode={} station={}", mode_name(session.mode), session.station_id);
}

} // namespace rplayer
