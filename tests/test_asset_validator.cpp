#include <gtest/gtest.h>

#include "manifest/asset_validator.hpp"
#include "manifest/manifest_parser.hpp"
#include "testing.hpp"

#include <sys/stat.h>

#include <set>
#include <string>

namespace uploader {
namespace {

class AssetValidatorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::vector<Asset> Assets(const std::string& lines) {
        ManifestParser parser;
        return parser.Parse("# images\n" + lines).assets;
    }

    void Touch(const std::string& name) { testutil::WriteFile(tmp.File(name), std::string("x")); }
};

TEST_F(AssetValidatorTest, PartitionsIntoPresentAndMissing) {
    Touch("redis-7.0.12.tar");
    Touch("busybox.tar");

    const auto assets = Assets("redis-7.0.12.tar\nbusybox.tar\npostgres-15.3.tar\n");
    const ValidationReport report = AssetValidator::Validate(assets, tmp.Path());

    EXPECT_EQ(report.PresentKeys(), (std::set<std::string>{"redis:7.0.12", "busybox:latest"}));
    EXPECT_EQ(report.MissingKeys(), (std::set<std::string>{"postgres:15.3"}));
    EXPECT_FALSE(report.Ok());
    EXPECT_EQ(report.present.size() + report.missing.size(), assets.size());
    EXPECT_EQ(report.present[0].source_path, tmp.File("redis-7.0.12.tar"));
}

TEST_F(AssetValidatorTest, EmptyDirectoryMakesEverythingMissing) {
    const auto assets = Assets("redis-7.0.12.tar\nbusybox.tar\n");
    const ValidationReport report = AssetValidator::Validate(assets, tmp.Path());
    EXPECT_TRUE(report.present.empty());
    EXPECT_EQ(report.missing.size(), 2u);
}

TEST_F(AssetValidatorTest, NonexistentDirectoryMakesEverythingMissing) {
    const auto assets = Assets("busybox.tar\n");
    const ValidationReport report = AssetValidator::Validate(assets, tmp.File("nope"));
    EXPECT_EQ(report.missing.size(), 1u);
}

TEST_F(AssetValidatorTest, PlaceholderMatchesAnyVersionButNotSignatures) {
    Touch("nginx-1.25.3-arm64.tar.gz.sha256");
    Touch("nginx-1.25.3-arm64.tar.gz");

    auto match = AssetValidator::FindMatchingFile(tmp.Path(), "nginx-xxxxx-arm64.tar.gz");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, tmp.File("nginx-1.25.3-arm64.tar.gz"));
}

TEST_F(AssetValidatorTest, PlaceholderWithOnlySignatureIsMissing) {
    Touch("nginx-1.25.3-arm64.tar.gz.asc");
    EXPECT_FALSE(AssetValidator::FindMatchingFile(tmp.Path(), "nginx-xxxxx-arm64.tar.gz").has_value());
}

TEST_F(AssetValidatorTest, MultipleMatchesPickFirstInSortedOrder) {
    Touch("app-2.0.tar");
    Touch("app-1.0.tar");
    auto match = AssetValidator::FindMatchingFile(tmp.Path(), "app-xxx.tar");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, tmp.File("app-1.0.tar"));
}

TEST_F(AssetValidatorTest, DirectoryWithAssetNameDoesNotCount) {
    ASSERT_EQ(::mkdir(tmp.File("busybox.tar").c_str(), 0755), 0);
    EXPECT_FALSE(AssetValidator::FindMatchingFile(tmp.Path(), "busybox.tar").has_value());
}

TEST_F(AssetValidatorTest, ValidationDoesNotModifyDirectory) {
    Touch("busybox.tar");
    const auto assets = Assets("busybox.tar\nredis-7.0.tar\n");
    (void)AssetValidator::Validate(assets, tmp.Path());
    EXPECT_EQ(testutil::ReadFile(tmp.File("busybox.tar")), "x");
    EXPECT_FALSE(testutil::FileExists(tmp.File("redis-7.0.tar")));
}

TEST_F(AssetValidatorTest, PlaceholderAssetIsKeyedByMatchedFile) {
    Touch("nginx-1.25-arm64.tar");

    const auto assets = Assets("nginx-xxxxx-arm64.tar\n");
    ASSERT_EQ(assets[0].identity.Key(), "nginx:xxxxx");

    const ValidationReport report = AssetValidator::Validate(assets, tmp.Path());
    ASSERT_EQ(report.present.size(), 1u);
    EXPECT_EQ(report.present[0].identity.Key(), "nginx:1.25");
    EXPECT_EQ(report.present[0].entry, "nginx-xxxxx-arm64.tar");
}

TEST_F(AssetValidatorTest, MissingPlaceholderKeepsPatternIdentity) {
    const ValidationReport report = AssetValidator::Validate(Assets("nginx-xxxxx-arm64.tar\n"), tmp.Path());
    EXPECT_EQ(report.MissingKeys(), (std::set<std::string>{"nginx:xxxxx"}));
}

TEST_F(AssetValidatorTest, EntriesResolvingToSameFileIdentityAreDeduplicated) {
    Touch("nginx-1.25-arm64.tar");

    const auto assets = Assets("nginx-1.25-arm64.tar\nnginx-xxxxx-arm64.tar\n");
    ASSERT_EQ(assets.size(), 2u);

    const ValidationReport report = AssetValidator::Validate(assets, tmp.Path());
    ASSERT_EQ(report.present.size(), 1u);
    EXPECT_EQ(report.present[0].line, 2u);
    EXPECT_TRUE(report.missing.empty());
}

TEST_F(AssetValidatorTest, CheckEntriesCoversEverySection) {
    Touch("a-1.0.tar");

    ManifestParser parser;
    const ParsedManifest manifest = parser.Parse("# 软件包\nmas-operator-2.0.run\n# 镜像\na-1.0.tar\n");
    ASSERT_EQ(manifest.entries.size(), 2u);

    const EntryReport report = AssetValidator::CheckEntries(manifest.entries, tmp.Path());
    EXPECT_FALSE(report.Ok());
    ASSERT_EQ(report.found.size(), 1u);
    EXPECT_EQ(report.found[0].source_path, tmp.File("a-1.0.tar"));
    ASSERT_EQ(report.missing.size(), 1u);
    EXPECT_EQ(report.missing[0].partition, "软件包");
    EXPECT_EQ(report.missing[0].text, "mas-operator-2.0.run");
}

} // namespace
} // namespace uploader
