#include <gtest/gtest.h>

#include "manifest/manifest_parser.hpp"
#include "testing.hpp"

#include <string>

namespace uploader {
namespace {

constexpr const char kManifest[] =
    "\xEF\xBB\xBF# 一、软件包\n"
    "mas-installer-1.0.0.zip\n"
    "\n"
    "# 二、镜像文件\n"
    "mas-api-server_2.3.1_x86_64.tar\n"
    "  redis-7.0.12-linux-amd64.tgz  \n"
    "nginx-xxxxx-arm64.tar.gz\n"
    "# 三、其他\n"
    "notes.tar\n";

TEST(ManifestParserTest, OnlyImageSectionBecomesAssets) {
    ManifestParser parser;
    const ParsedManifest m = parser.Parse(kManifest);

    ASSERT_EQ(m.assets.size(), 3u);
    EXPECT_EQ(m.assets[0].identity.Key(), "mas-api-server:2.3.1");
    EXPECT_EQ(m.assets[0].line, 5u);
    EXPECT_EQ(m.assets[0].partition, "二、镜像文件");
    EXPECT_EQ(m.assets[0].kind, AssetKind::Image);
    EXPECT_EQ(m.assets[1].entry, "redis-7.0.12-linux-amd64.tgz");
    EXPECT_EQ(m.assets[2].identity.Key(), "nginx:xxxxx");
    EXPECT_TRUE(m.warnings.empty());

    // every non-header line is kept as an entry
    ASSERT_EQ(m.entries.size(), 5u);
    EXPECT_EQ(m.entries[0].partition, "一、软件包");
    EXPECT_EQ(m.entries[4].text, "notes.tar");
}

TEST(ManifestParserTest, EnglishHeaderMatchesCaseInsensitively) {
    ManifestParser parser;
    const ParsedManifest m = parser.Parse("## Docker IMAGES\nbusybox.tar\n");
    ASSERT_EQ(m.assets.size(), 1u);
    EXPECT_EQ(m.assets[0].identity.Key(), "busybox:latest");
    EXPECT_EQ(m.assets[0].partition, "Docker IMAGES");
}

TEST(ManifestParserTest, ArchiveKeywordsClassifyArchives) {
    PartitionPolicy policy;
    policy.archive_keywords = {"软件包"};
    ManifestParser parser(policy);
    const ParsedManifest m = parser.Parse(kManifest);

    ASSERT_EQ(m.assets.size(), 4u);
    EXPECT_EQ(m.assets[0].identity.Key(), "mas-installer:1.0.0");
    EXPECT_EQ(m.assets[0].kind, AssetKind::Archive);
    EXPECT_EQ(m.assets[1].kind, AssetKind::Image);
}

TEST(ManifestParserTest, MalformedLineIsWarningAndRunContinues) {
    ManifestParser parser;
    const ParsedManifest m = parser.Parse("# images\nREADME\nbusybox.tar\n");
    ASSERT_EQ(m.assets.size(), 1u);
    ASSERT_EQ(m.warnings.size(), 1u);
    EXPECT_EQ(m.warnings[0].line, 2u);
}

TEST(ManifestParserTest, DuplicateIdentityKeepsFirst) {
    ManifestParser parser;
    const ParsedManifest m = parser.Parse("# images\nredis-7.0.tar\nredis-7.0-amd64.tar\n");
    ASSERT_EQ(m.assets.size(), 1u);
    EXPECT_EQ(m.assets[0].entry, "redis-7.0.tar");
    ASSERT_EQ(m.warnings.size(), 1u);
    EXPECT_EQ(m.warnings[0].line, 3u);
    EXPECT_NE(m.warnings[0].message.find("first declared on line 2"), std::string::npos);
}

TEST(ManifestParserTest, NoRecognizedSectionWarns) {
    ManifestParser parser;
    const ParsedManifest m = parser.Parse("busybox.tar\n# docs\nguide.tar\n");
    EXPECT_TRUE(m.assets.empty());
    ASSERT_EQ(m.warnings.size(), 1u);
    EXPECT_EQ(m.warnings[0].line, 0u);
}

TEST(ManifestParserTest, CrLfLineEndings) {
    ManifestParser parser;
    const ParsedManifest m = parser.Parse("# images\r\nbusybox-1.36.tar\r\n");
    ASSERT_EQ(m.assets.size(), 1u);
    EXPECT_EQ(m.assets[0].identity.Key(), "busybox:1.36");
}

TEST(ManifestParserTest, LoadMissingFileFails) {
    auto m = LoadManifestFile("/nonexistent/assets.txt", PartitionPolicy{});
    ASSERT_FALSE(m.has_value());
    EXPECT_NE(m.error().find("Assets file not readable"), std::string::npos);
}

TEST(ManifestParserTest, LoadFromFile) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.File("assets.txt"), std::string(kManifest));
    auto m = LoadManifestFile(tmp.File("assets.txt"), PartitionPolicy{});
    ASSERT_TRUE(m.has_value()) << m.error();
    EXPECT_EQ(m->assets.size(), 3u);
}

} // namespace
} // namespace uploader
