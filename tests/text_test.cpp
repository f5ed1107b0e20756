#include "text_util.hpp"
#include "xml_scan.hpp"

#include <gtest/gtest.h>

namespace rplayer {
namespace {

TEST(TextUtilTest, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("2345"), "MjM0NQ==");
    EXPECT_EQ(base64_encode("bcd151"), "YmNkMTUx");
}

TEST(TextUtilTest, WithQueryReplacesExistingKeys) {
    EXPECT_EQ(with_query("https://x.test/p?station_id=A&l=15", {{"station_id", "B"}}),
              "https://x.test/p?l=15&station_id=B");
    EXPECT_EQ(with_query("https://x.test/p", {}), "https://x.test/p");
}

TEST(TextUtilTest, ResolveUrl) {
    EXPECT_EQ(resolve_url("https://x.test/a/b/playlist.m3u8", "chunk.m3u8"), "https://x.test/a/b/chunk.m3u8");
    EXPECT_EQ(resolve_url("https://x.test/a/b/playlist.m3u8", "/root.m3u8"), "https://x.test/root.m3u8");
    EXPECT_EQ(resolve_url("https://x.test/a/", "https://y.test/z.m3u8"), "https://y.test/z.m3u8");
}

TEST(TextUtilTest, FitTextCountsCodePoints) {
    EXPECT_EQ(fit_text("short", 10), "short");
    EXPECT_EQ(fit_text("abcdefghij", 6), "abc...");
    // Five three-byte characters cut to two plus the ellipsis
    EXPECT_EQ(fit_text("\xE3\x81\x82\xE3\x81\x84\xE3\x81\x86\xE3\x81\x88\xE3\x81\x8A", 5),
              "\xE3\x81\x82\xE3\x81\x84\xE3\x81\x86\xE3\x81\x88\xE3\x81\x8A");
    EXPECT_EQ(fit_text("\xE3\x81\x82\xE3\x81\x84\xE3\x81\x86\xE3\x81\x88\xE3\x81\x8A", 4),
              "\xE3\x81\x82...");
}

TEST(TextUtilTest, SplitList) {
    auto parts = split_list(" a, ,b ,c");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "b");
}

TEST(XmlScanTest, FindsElementsAndAttributes) {
    const std::string xml =
        "<?xml version=\"1.0\"?><urls>"
        "<url areafree=\"1\" timefree=\"0\"><playlist_create_url>https://a.test/1</playlist_create_url></url>"
        "<url areafree='0' timefree='0'><playlist_create_url>https://b.test/2</playlist_create_url></url>"
        "</urls>";
    auto urls = xml_find_all(xml, "url");
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0].attribute("areafree"), "1");
    EXPECT_EQ(urls[1].attribute("areafree"), "0");
    EXPECT_EQ(urls[1].child_text("playlist_create_url"), "https://b.test/2");
    EXPECT_EQ(urls[0].attribute("missing"), "");
}

TEST(XmlScanTest, DecodesEntitiesAndCdata) {
    auto prog = xml_find("<prog><title><![CDATA[Rock & Roll]]></title><pfm>A &amp; B</pfm></prog>", "prog");
    ASSERT_TRUE(prog.has_value());
    EXPECT_EQ(prog->child_text("title"), "Rock & Roll");
    EXPECT_EQ(prog->child_text("pfm"), "A & B");
    EXPECT_EQ(xml_decode("&lt;x&gt; &#65;&#x42;"), "<x> AB");
}

TEST(XmlScanTest, DoesNotConfuseTagPrefixes) {
    auto found = xml_find_all("<stations><station_count>2</station_count><station><id>TBS</id></station></stations>",
                              "station");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].child_text("id"), "TBS");
}

TEST(XmlScanTest, SelfClosingElements) {
    auto found = xml_find_all("<list><img src=\"a\"/><img src=\"b\" /></list>", "img");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[1].attribute("src"), "b");
    EXPECT_EQ(found[1].text(), "");
}

} // namespace
} // namespace rplayer
