#ifndef STATION_HPP
#define STATION_HPP

#include <optional>
#include <string>
#include <vector>

namespace rplayer {

enum class Mode {
    Curated,
    World,
};

const char* mode_name(Mode mode);
std::optional<Mode> parse_mode(const std::string& name);

// A playable source. Immutable once loaded.
struct StationDescriptor {
    std::string id;
    std::string name;
    std::string stream_url;  // fixed override; empty = resolve through upstream
    std::string image_url;
    Mode source = Mode::Curated;

    bool has_fixed_url() const { return !stream_url.empty(); }

    // Display name, falling back to the identifier
    const std::string& label() const { return name.empty() ? id : name; }
};

// Load the curated list. Accepts an array of {id,name,stream_url,image_url}
// objects or an object mapping display name to fixed URL. Returns an empty
// list when the file is missing or unparsable.
std::vector<StationDescriptor> load_stations(const std::string& filename);

// Write {id,name} entries (used by the station list export)
bool save_station_list(const std::string& filename, const std::vector<StationDescriptor>& stations);

} // namespace rplayer

#endif // STATION_HPP
