#include "station_registry.hpp"

#include <spdlog/spdlog.h>

namespace rplayer {

StationRegistry::StationRegistry(std::vector<StationDescriptor> curated,
                                 StationDirectory* directory,
                                 std::mt19937::result_type seed)
    : curated_(std::move(curated)), directory_(directory), rng_(seed) {}

void StationRegistry::set_mode(Mode mode) {
    if (mode == mode_) {
        return;
    }
    mode_ = mode;
    if (mode_ == Mode::Curated) {
        cursor_ = 0;
    }
    spdlog::debug("registry: mode -> {}", mode_name(mode_));
}

const StationDescriptor* StationRegistry::current() const {
    if (mode_ == Mode::World) {
        return world_current_ ? &*world_current_ : nullptr;
    }
    if (curated_.empty()) {
        return nullptr;
    }
    return &curated_[cursor_];
}

const StationDescriptor* StationRegistry::next() {
    if (mode_ == Mode::World) {
        return world_lookup();
    }
    if (curated_.empty()) return nullptr;
    cursor_ = (cursor_ + 1) % curated_.size();
    return &curated_[cursor_];
}

const StationDescriptor* StationRegistry::previous() {
    if (mode_ == Mode::World) {
        return world_lookup();
    }
    if (curated_.empty()) return nullptr;
    cursor_ = (cursor_ + curated_.size() - 1) % curated_.size();
    return &curated_[cursor_];
}

const StationDescriptor* StationRegistry::world_lookup() {
    if (!directory_) {
        return current();
    }
    return adopt_world_set(directory_->lookup());
}

const StationDescriptor* StationRegistry::adopt_world_set(std::vector<StationDescriptor> stations) {
    if (stations.empty()) {
        spdlog::warn("registry: world lookup returned nothing, keeping current pick");
        return world_current_ ? &*world_current_ : nullptr;
    }
    world_set_ = std::move(stations);
    std::uniform_int_distribution<size_t> pick(0, world_set_.size() - 1);
    world_current_ = world_set_[pick(rng_)];
    world_current_->source = Mode::World;
    spdlog::debug("registry: world pick -> {}", world_current_->label());
    return &*world_current_;
}

void StationRegistry::select_world(const StationDescriptor& station) {
    world_current_ = station;
    world_current_->source = Mode::World;
}

bool StationRegistry::select_curated(const std::string& id) {
    auto index = find_curated(id);
    if (!index) {
        return false;
    }
    cursor_ = *index;
    return true;
}

std::optional<size_t> StationRegistry::find_curated(const std::string& id) const {
    for (size_t i = 0; i < curated_.size(); ++i) {
        if (curated_[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

const StationDescriptor* StationRegistry::find(const std::string& id) const {
    if (auto index = find_curated(id)) {
        return &curated_[*index];
    }
    if (world_current_ && world_current_->id == id) {
        return &*world_current_;
    }
    for (const auto& station : world_set_) {
        if (station.id == id) return &station;
    }
    return nullptr;
}

} // namespace rplayer
