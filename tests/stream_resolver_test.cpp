#include "stream_resolver.hpp"
#include "errors.hpp"

#include "fakes.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace rplayer {
namespace {

using test::FakeHttpClient;
using test::fixed_station;
using test::ManualClock;
using test::upstream_station;

constexpr const char* AUTH1 = "https://auth.test/auth1";
constexpr const char* AUTH2 = "https://auth.test/auth2";
constexpr const char* STREAM_XML = "https://api.test/stream/TBS.xml";
constexpr const char* STATION_LIST = "https://api.test/list/JP13.xml";
constexpr const char* CREATE_URL = "https://si.test/v3/playlist/create";

const char* const DESCRIPTOR =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<urls>\n"
    "  <url areafree=\"1\" timefree=\"1\"><playlist_create_url>https://tf.test/v3/ts</playlist_create_url></url>\n"
    "  <url areafree=\"0\" timefree=\"0\"><playlist_create_url>https://si.test/v3/playlist/create"
    "</playlist_create_url></url>\n"
    "</urls>\n";

const char* const PLAYLIST =
    "#EXTM3U\n#EXT-X-VERSION:3\n#EXT-X-STREAM-INF:BANDWIDTH=52973,CODECS=\"mp4a.40.5\"\n"
    "https://hls.test/live/TBS/chunklist.m3u8?lsid=abc\n";

class StreamResolverTest : public ::testing::Test {
protected:
    StreamResolverTest() {
        AuthConfig auth;
        auth.authkey = "0123456789abcdef";
        auth.auth1_urls = {AUTH1};
        auth.auth2_urls = {AUTH2};
        auth.max_attempts = 2;
        auth_ = std::make_unique<AuthTokenManager>(http_, auth, clock_.fn(), [](std::chrono::milliseconds) {});

        endpoints_.stream_xml_urls = {"https://api.test/stream/{station}.xml"};
        endpoints_.station_list_url = "https://api.test/list/{area}.xml";
        resolver_ = std::make_unique<StreamResolver>(http_, *auth_, endpoints_);
    }

    void script_auth() {
        http_.respond(AUTH1, 200, "", {{"X-Radiko-AuthToken", "tok-1"},
                                       {"X-Radiko-KeyLength", "4"},
                                       {"X-Radiko-KeyOffset", "2"}});
        http_.respond(AUTH2, 200, "JP13,tokyo Japan");
    }

    void script_station_list() {
        http_.respond(STATION_LIST, 200,
                      "<stations area_id=\"JP13\"><station><id>TBS</id><name>TBS Radio</name>"
                      "<logo>https://img.test/TBS.png</logo></station>"
                      "<station><id>QRR</id><name>Bunka Hoso</name></station></stations>");
    }

    FakeHttpClient http_;
    ManualClock clock_;
    EndpointConfig endpoints_;
    std::unique_ptr<AuthTokenManager> auth_;
    std::unique_ptr<StreamResolver> resolver_;
};

TEST_F(StreamResolverTest, FixedUrlNeedsNoNetwork) {
    StreamRef stream = resolver_->resolve(fixed_station("jazz", "http://jazz.test/stream"));
    EXPECT_EQ(stream.url, "http://jazz.test/stream");
    EXPECT_EQ(stream.station_id, "jazz");
    EXPECT_FALSE(stream.needs_headers());
    EXPECT_EQ(http_.total(), 0u);
}

TEST_F(StreamResolverTest, FixedUrlWorksWhileAuthIsDown) {
    EXPECT_NO_THROW(resolver_->resolve(fixed_station("jazz", "http://jazz.test/stream")));
    EXPECT_EQ(auth_->handshakeCount(), 0);
}

TEST_F(StreamResolverTest, ResolvesDescriptorToPlaylist) {
    script_auth();
    script_station_list();
    http_.respond(STREAM_XML, 200, DESCRIPTOR);
    http_.respond(CREATE_URL, 200, PLAYLIST);

    StreamRef stream = resolver_->resolve(upstream_station("TBS"));
    EXPECT_EQ(stream.url, "https://hls.test/live/TBS/chunklist.m3u8?lsid=abc");
    EXPECT_TRUE(stream.needs_headers());
    EXPECT_NE(std::find(stream.headers.begin(), stream.headers.end(),
                        std::make_pair(std::string("X-Radiko-AuthToken"), std::string("tok-1"))),
              stream.headers.end());
    // The live entry is tried before the time-free one
    EXPECT_EQ(http_.count("https://tf.test/v3/ts"), 0u);
}

TEST_F(StreamResolverTest, ReusesResolvedUrl) {
    script_auth();
    http_.respond(STREAM_XML, 200, DESCRIPTOR);
    http_.respond(CREATE_URL, 200, PLAYLIST);

    resolver_->resolve(upstream_station("TBS"));
    resolver_->resolve(upstream_station("TBS"));
    EXPECT_EQ(http_.count(STREAM_XML), 1u);
}

TEST_F(StreamResolverTest, DirectHlsUrlInDescriptor) {
    script_auth();
    http_.respond(STREAM_XML, 200,
                  "<urls><url><playlist_url>https://hls.test/TBS/playlist.m3u8?station_id=TBS&amp;l=15"
                  "</playlist_url></url></urls>");
    StreamRef stream = resolver_->resolve(upstream_station("TBS"));
    EXPECT_EQ(stream.url, "https://hls.test/TBS/playlist.m3u8?station_id=TBS&l=15");
}

TEST_F(StreamResolverTest, UnknownStationIsNotFound) {
    script_auth();
    EXPECT_THROW(resolver_->resolve(upstream_station("XYZ")), StationNotFound);
}

TEST_F(StreamResolverTest, StationOutsideAreaIsNotFound) {
    script_auth();
    script_station_list();
    http_.respond("https://api.test/stream/MBS.xml", 200, DESCRIPTOR);
    EXPECT_THROW(resolver_->resolve(upstream_station("MBS")), StationNotFound);
    EXPECT_EQ(http_.count("https://api.test/stream/MBS.xml"), 0u);
}

TEST_F(StreamResolverTest, DescriptorWithoutPlaylistIsUnresolvable) {
    script_auth();
    http_.respond(STREAM_XML, 200, "<urls></urls>");
    EXPECT_THROW(resolver_->resolve(upstream_station("TBS")), StationUnresolvable);
}

TEST_F(StreamResolverTest, RejectedTokenIsDropped) {
    script_auth();
    http_.respond(STREAM_XML, 403, "");
    EXPECT_THROW(resolver_->resolve(upstream_station("TBS")), StationUnresolvable);
    EXPECT_FALSE(auth_->cached().has_value());
}

TEST_F(StreamResolverTest, AuthFailureSurfaces) {
    EXPECT_THROW(resolver_->resolve(upstream_station("TBS")), AuthUnavailable);
}

TEST_F(StreamResolverTest, AreaStationsParsesAndCaches) {
    script_station_list();
    auto stations = resolver_->areaStations("JP13");
    ASSERT_EQ(stations.size(), 2u);
    EXPECT_EQ(stations[0].id, "TBS");
    EXPECT_EQ(stations[0].name, "TBS Radio");
    EXPECT_EQ(stations[0].image_url, "https://img.test/TBS.png");
    resolver_->areaStations("JP13");
    EXPECT_EQ(http_.count(STATION_LIST), 1u);
}

TEST(StreamResolverParseTest, ExtractPlaylistResolvesRelativeEntries) {
    auto url = StreamResolver::extractPlaylist("#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=1\nlive/chunks.m3u8\n",
                                               "https://hls.test/a/master.m3u8");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://hls.test/a/live/chunks.m3u8");
    EXPECT_FALSE(StreamResolver::extractPlaylist("<html>denied</html>", "https://x.test/").has_value());
}

} // namespace
} // namespace rplayer
