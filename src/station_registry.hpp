#ifndef STATION_REGISTRY_HPP
#define STATION_REGISTRY_HPP

#include "station.hpp"
#include "world_directory.hpp"

#include <optional>
#include <random>
#include <vector>

namespace rplayer {

// Curated list with a wrap-around cursor, plus the world-radio working set.
// Not thread-safe: owned by the session controller loop.
class StationRegistry {
public:
    explicit StationRegistry(std::vector<StationDescriptor> curated,
                             StationDirectory* directory = nullptr,
                             std::mt19937::result_type seed = std::random_device{}());

    Mode mode() const { return mode_; }

    // Switch modes. Entering curated mode puts the cursor back on the first
    // entry. The world working set and last pick survive toggles; the last
    // pick is what an empty lookup falls back to.
    void set_mode(Mode mode);

    // Descriptor at the cursor (curated) or the current pick (world);
    // nullptr in world mode before the first lookup
    const StationDescriptor* current() const;

    // Curated: advance/retreat the cursor modulo the list length.
    // World: fresh directory lookup and uniform random pick from the result.
    const StationDescriptor* next();
    const StationDescriptor* previous();

    // Replace the world working set and pick uniformly at random from it.
    // An empty set keeps the previous selection.
    const StationDescriptor* adopt_world_set(std::vector<StationDescriptor> stations);

    // Restore a persisted world pick without a lookup
    void select_world(const StationDescriptor& station);

    // Move the curated cursor onto the given id; false if unknown
    bool select_curated(const std::string& id);

    std::optional<size_t> find_curated(const std::string& id) const;
    const StationDescriptor* find(const std::string& id) const;

    StationDirectory* directory() const { return directory_; }

    // Current world pick regardless of mode, nullptr before the first one
    const StationDescriptor* world_current() const { return world_current_ ? &*world_current_ : nullptr; }

    size_t cursor() const { return cursor_; }
    const std::vector<StationDescriptor>& curated() const { return curated_; }
    const std::vector<StationDescriptor>& world_set() const { return world_set_; }

private:
    const StationDescriptor* world_lookup();

    std::vector<StationDescriptor> curated_;
    size_t cursor_ = 0;

    StationDirectory* directory_;
    std::vector<StationDescriptor> world_set_;
    std::optional<StationDescriptor> world_current_;

    Mode mode_ = Mode::Curated;
    std::mt19937 rng_;
};

} // namespace rplayer

#endif // STATION_REGISTRY_HPP
