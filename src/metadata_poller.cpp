#include "metadata_poller.hpp"

#include "errors.hpp"
#include "text_util.hpp"
#include "xml_scan.hpp"

#include <cctype>
#include <ctime>
#include <spdlog/spdlog.h>

namespace rplayer {

namespace {

constexpr auto JST_OFFSET = std::chrono::hours(9);

bool uses_schedule(const StationDescriptor& station) {
    return station.source == Mode::Curated && !station.has_fixed_url();
}

} // namespace

MetadataPoller::MetadataPoller(HttpClient& http, EndpointConfig endpoints, PollConfig poll, Clock clock)
    : http_(http), endpoints_(std::move(endpoints)), poll_(poll), clock_(std::move(clock)) {}

MetadataPoller::~MetadataPoller() {
    stop();
}

void MetadataPoller::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void MetadataPoller::set_title_source(TitleSource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    title_source_ = std::move(source);
}

void MetadataPoller::start() {
    if (!running_.exchange(true)) {
        now_playing_worker_ = std::thread(&MetadataPoller::nowPlayingThread, this);
        program_worker_ = std::thread(&MetadataPoller::programThread, this);
    }
}

void MetadataPoller::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        }
        if (now_playing_worker_.joinable()) now_playing_worker_.join();
        if (program_worker_.joinable()) program_worker_.join();
    }
}

uint64_t MetadataPoller::station_changed(const StationDescriptor& station) {
    std::lock_guard<std::mutex> lock(mutex_);
    station_ = station;
    uint64_t epoch = ++epoch_;
    kick_ = true;
    cv_.notify_all();
    spdlog::debug("metadata: now tracking {} (epoch {})", station.id, epoch);
    return epoch;
}

bool MetadataPoller::is_stale(const NowPlaying& now_playing, std::chrono::system_clock::time_point now) const {
    return now - now_playing.fetched_at > poll_.now_playing * poll_.stale_multiplier;
}

std::string MetadataPoller::jstDate(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when + JST_OFFSET);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> MetadataPoller::parseJst(const std::string& text) {
    if (text.size() != 14) return std::nullopt;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    auto field = [&](size_t pos, size_t len) { return std::stoi(text.substr(pos, len)); };

    std::tm tm{};
    tm.tm_year = field(0, 4) - 1900;
    tm.tm_mon = field(4, 2) - 1;
    tm.tm_mday = field(6, 2);
    tm.tm_hour = field(8, 2);
    tm.tm_min = field(10, 2);
    tm.tm_sec = field(12, 2);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 29 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    // timegm normalises hours past 23, which the schedule uses for late night
    std::time_t utc = timegm(&tm);
    return std::chrono::system_clock::from_time_t(utc) - JST_OFFSET;
}

std::vector<ProgramEntry> MetadataPoller::parseSchedule(const std::string& xml) {
    std::vector<ProgramEntry> programs;
    for (const auto& prog : xml_find_all(xml, "prog")) {
        auto start = parseJst(prog.attribute("ft"));
        auto end = parseJst(prog.attribute("to"));
        if (!start || !end) {
            continue;
        }
        programs.push_back({*start, *end, prog.child_text("title"), prog.child_text("img")});
    }
    return programs;
}

std::vector<ProgramEntry> MetadataPoller::fetchSchedule(const std::string& station_id, const std::string& date) {
    std::string url = expand_template(endpoints_.program_url, {{"station", station_id}, {"date", date}});
    HttpResponse res = http_.get(url, {}, REQUEST_TIMEOUT);
    if (!res.ok()) {
        throw MetadataUnavailable("program schedule for " + station_id + ": " +
                                  (res.status ? "HTTP " + std::to_string(res.status) : res.error));
    }
    auto programs = parseSchedule(res.body);
    if (programs.empty()) {
        throw MetadataUnavailable("program schedule for " + station_id + " has no entries");
    }
    spdlog::debug("metadata: {} programs for {} on {}", programs.size(), station_id, date);
    return programs;
}

std::vector<ProgramEntry> MetadataPoller::schedule(const std::string& station_id,
                                                   std::chrono::system_clock::time_point now, bool force) {
    std::string date = jstDate(now);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = schedules_.find(station_id);
        if (!force && it != schedules_.end() && it->second.date == date &&
            now - it->second.fetched_at < poll_.program) {
            return it->second.programs;
        }
    }

    auto programs = fetchSchedule(station_id, date);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    schedules_[station_id] = {date, now, programs};
    return programs;
}

std::optional<ProgramEntry> MetadataPoller::current_program(const std::string& station_id,
                                                            std::chrono::system_clock::time_point now) {
    for (const auto& program : schedule(station_id, now, false)) {
        if (program.start <= now && now < program.end) {
            return program;
        }
    }
    return std::nullopt;
}

std::string MetadataPoller::fetchArtwork(const std::string& url) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (url == artwork_url_) return artwork_;
    }
    HttpResponse res = http_.get(url, {}, REQUEST_TIMEOUT);
    if (!res.ok() || res.body.empty()) {
        spdlog::debug("metadata: artwork {} unavailable ({})", url, res.status ? std::to_string(res.status) : res.error);
        return "";
    }
    std::lock_guard<std::mutex> lock(cache_mutex_);
    artwork_url_ = url;
    artwork_ = res.body;
    return artwork_;
}

std::optional<NowPlaying> MetadataPoller::poll_once() {
    std::optional<StationDescriptor> station;
    uint64_t epoch;
    TitleSource title_source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        station = station_;
        epoch = epoch_;
        title_source = title_source_;
    }
    if (!station) {
        return std::nullopt;
    }

    NowPlaying result;
    result.station_id = station->id;
    result.epoch = epoch;
    result.fetched_at = clock_();

    bool schedule_failed = false;
    if (uses_schedule(*station)) {
        try {
            if (auto program = current_program(station->id, result.fetched_at)) {
                result.title = program->title;
                result.artwork_url = program->image_url;
            }
        } catch (const MetadataUnavailable& e) {
            spdlog::debug("metadata: {}", e.what());
            schedule_failed = true;
        }
    }
    if (result.title.empty() && title_source) {
        result.title = trim(title_source());
    }
    if (schedule_failed && result.title.empty()) {
        return std::nullopt;
    }

    if (result.artwork_url.empty()) {
        result.artwork_url = station->image_url;
    }
    if (!result.artwork_url.empty() && epoch == epoch_) {
        result.artwork = fetchArtwork(result.artwork_url);
    }

    if (epoch != epoch_) {
        spdlog::debug("metadata: dropping result for {} (epoch {} superseded)", result.station_id, epoch);
        return std::nullopt;
    }
    return result;
}

void MetadataPoller::refresh_program() {
    std::optional<StationDescriptor> station;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        station = station_;
    }
    if (!station || !uses_schedule(*station)) {
        return;
    }
    try {
        schedule(station->id, clock_(), true);
    } catch (const MetadataUnavailable& e) {
        spdlog::warn("metadata: {}", e.what());
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    kick_ = true;
    cv_.notify_all();
}

void MetadataPoller::deliver(NowPlaying now_playing) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (now_playing.epoch != epoch_) return;
        sink = sink_;
    }
    if (sink) {
        sink(std::move(now_playing));
    }
}

void MetadataPoller::nowPlayingThread() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, poll_.now_playing, [this] { return !running_ || kick_; });
            if (!running_) break;
            kick_ = false;
        }
        if (auto result = poll_once()) {
            deliver(std::move(*result));
        }
    }
}

void MetadataPoller::programThread() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, poll_.program, [this] { return !running_.load(); });
            if (!running_) break;
        }
        refresh_program();
    }
}

} // namespace rplayer
