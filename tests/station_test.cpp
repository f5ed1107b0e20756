#include "station.hpp"
#include "world_directory.hpp"

#include "fakes.hpp"

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace rplayer {
namespace {

class StationFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "rplayer_stations_" + std::to_string(getpid()) + ".json";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write(const std::string& text) {
        std::ofstream file(path_);
        file << text;
    }

    std::string path_;
};

TEST_F(StationFileTest, ArrayOfDescriptors) {
    write(R"([
        {"id": "TBS", "name": "TBS Radio"},
        {"id": "jazz", "name": "Jazz", "stream_url": " http://jazz.test/live ", "image_url": "http://jazz.test/i.png"},
        {"name": "Nameless"},
        "garbage"
    ])");
    auto stations = load_stations(path_);
    ASSERT_EQ(stations.size(), 2u);
    EXPECT_EQ(stations[0].id, "TBS");
    EXPECT_FALSE(stations[0].has_fixed_url());
    EXPECT_EQ(stations[1].stream_url, "http://jazz.test/live");
    EXPECT_EQ(stations[1].source, Mode::Curated);
}

TEST_F(StationFileTest, NameToUrlObject) {
    write(R"({"Jazz FM": "http://jazz.test/live", "Broken": 12})");
    auto stations = load_stations(path_);
    ASSERT_EQ(stations.size(), 1u);
    EXPECT_EQ(stations[0].id, "Jazz FM");
    EXPECT_EQ(stations[0].label(), "Jazz FM");
    EXPECT_TRUE(stations[0].has_fixed_url());
}

TEST_F(StationFileTest, MissingOrInvalidFileGivesEmptyList) {
    EXPECT_TRUE(load_stations(path_ + ".missing").empty());
    write("{not json");
    EXPECT_TRUE(load_stations(path_).empty());
}

TEST_F(StationFileTest, SavedListLoadsBack) {
    ASSERT_TRUE(save_station_list(path_, {test::upstream_station("QRR", "Bunka Hoso"),
                                          test::upstream_station("TBS", "TBS Radio")}));
    auto stations = load_stations(path_);
    ASSERT_EQ(stations.size(), 2u);
    EXPECT_EQ(stations[1].id, "TBS");
    EXPECT_EQ(stations[1].name, "TBS Radio");
}

TEST(StationTest, LabelFallsBackToId) {
    EXPECT_EQ(test::upstream_station("LFR").label(), "LFR");
    EXPECT_EQ(parse_mode("radiko"), Mode::Curated);
    EXPECT_EQ(parse_mode("world"), Mode::World);
    EXPECT_FALSE(parse_mode("am").has_value());
}

TEST(WorldDirectoryTest, ParseResponse) {
    auto stations = RadioBrowserDirectory::parseResponse(R"([
        {"stationuuid": "u1", "name": "Radio One", "url": "http://one.test/", "url_resolved": "http://one.test/r",
         "favicon": "http://one.test/f.png"},
        {"name": "No UUID", "url": "http://two.test/"},
        {"name": "", "url": "http://three.test/"},
        {"stationuuid": "u4", "name": "No URL"}
    ])");
    ASSERT_EQ(stations.size(), 2u);
    EXPECT_EQ(stations[0].id, "u1");
    EXPECT_EQ(stations[0].stream_url, "http://one.test/r");
    EXPECT_EQ(stations[0].image_url, "http://one.test/f.png");
    EXPECT_EQ(stations[0].source, Mode::World);
    EXPECT_EQ(stations[1].id, "No UUID");
    EXPECT_TRUE(RadioBrowserDirectory::parseResponse("{\"error\": 1}").empty());
    EXPECT_TRUE(RadioBrowserDirectory::parseResponse("<html>").empty());
}

TEST(WorldDirectoryTest, LookupKeepsLastGoodSet) {
    test::FakeHttpClient http;
    RadioBrowserDirectory directory(http, "https://rb.test/json", 50);
    const std::string url = "https://rb.test/json/stations/search?hidebroken=true&limit=50";
    http.respond(url, 200, R"([{"stationuuid": "u1", "name": "Radio One", "url": "http://one.test/"}])");
    ASSERT_EQ(directory.lookup().size(), 1u);

    http.respond(url, 503, "");
    auto again = directory.lookup();
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].id, "u1");
    EXPECT_EQ(http.count(url), 2u);
}

} // namespace
} // namespace rplayer
