#ifndef STATE_STORE_HPP
#define STATE_STORE_HPP

#include "station.hpp"

#include <optional>
#include <string>

namespace rplayer {

// What survives a restart
struct PersistedSession {
    Mode mode = Mode::Curated;
    std::string station_id;
    std::optional<StationDescriptor> world_station;  // last world pick, if any

    bool operator==(const PersistedSession& other) const;
};

class StateStore {
public:
    virtual ~StateStore() = default;

    // nullopt when nothing was saved yet; throws PersistenceError when the
    // record exists but cannot be read or parsed
    virtual std::optional<PersistedSession> load() = 0;

    // Throws PersistenceError
    virtual void save(const PersistedSession& session) = 0;
};

// JSON file {"mode","station_id","world_name","world_url","world_image_url"},
// replaced atomically through a temporary file and rename()
class JsonStateStore : public StateStore {
public:
    explicit JsonStateStore(std::string path);

    std::optional<PersistedSession> load() override;
    void save(const PersistedSession& session) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace rplayer

#endif // STATE_STORE_HPP
