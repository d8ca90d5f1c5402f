#include <gtest/gtest.h>

#include "ledger/progress_store.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>
#include <sys/stat.h>

#include <filesystem>
#include <string>

namespace uploader {
namespace {

class ProgressStoreTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::string path = tmp.File(".progress.json");
};

TEST_F(ProgressStoreTest, MissingFileLoadsEmpty) {
    ProgressStore store(path);
    EXPECT_TRUE(store.Load().empty());
    EXPECT_EQ(store.StatusOf("redis:7.0"), AssetStatus::Pending);
    EXPECT_FALSE(testutil::FileExists(path));
}

TEST_F(ProgressStoreTest, CorruptFileLoadsEmpty) {
    testutil::WriteFile(path, std::string("{\"assets\": {\"redis:7.0\": "));
    ProgressStore store(path);
    EXPECT_TRUE(store.Load().empty());
}

TEST_F(ProgressStoreTest, UnknownStatusIsCorrupt) {
    testutil::WriteFile(path, std::string(R"({"version":1,"assets":{"a:1":{"status":"weird"}}})"));
    ProgressStore store(path);
    EXPECT_TRUE(store.Load().empty());
}

TEST_F(ProgressStoreTest, RecordIsDurableAcrossRestart) {
    {
        ProgressStore store(path);
        store.Load();
        ASSERT_TRUE(store.Record("redis:7.0", AssetStatus::Pushed,
                                 {.message = {}, .digest = "sha256:abc", .size = 42}).is_ok());
        ASSERT_TRUE(store.Record("nginx:1.25", AssetStatus::Failed,
                                 {.message = "push failed: exit 1: denied", .digest = {}, .size = std::nullopt}).is_ok());
    }

    ProgressStore reloaded(path);
    const Ledger& ledger = reloaded.Load();
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(reloaded.StatusOf("redis:7.0"), AssetStatus::Pushed);
    EXPECT_EQ(reloaded.Find("redis:7.0")->digest, "sha256:abc");
    ASSERT_TRUE(reloaded.Find("redis:7.0")->size.has_value());
    EXPECT_EQ(*reloaded.Find("redis:7.0")->size, 42u);
    EXPECT_EQ(reloaded.StatusOf("nginx:1.25"), AssetStatus::Failed);
    EXPECT_EQ(reloaded.Find("nginx:1.25")->detail, "push failed: exit 1: denied");
    EXPECT_FALSE(reloaded.Find("nginx:1.25")->updated_at.empty());
}

TEST_F(ProgressStoreTest, FileIsCompleteJsonWithoutTempLeftovers) {
    ProgressStore store(path);
    store.Load();
    ASSERT_TRUE(store.Record("busybox:latest", AssetStatus::Pushed).is_ok());

    const auto j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j.at("version").get<int>(), 1);
    EXPECT_EQ(j.at("assets").at("busybox:latest").at("status").get<std::string>(), "pushed");
    EXPECT_FALSE(j.at("assets").at("busybox:latest").contains("detail"));

    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(tmp.Path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST_F(ProgressStoreTest, FailedWriteKeepsPreviousFile) {
    const std::string blocked = tmp.File("blocked.json");
    ASSERT_EQ(::mkdir(blocked.c_str(), 0755), 0);
    testutil::WriteFile(blocked + "/keep", std::string("x"));

    ProgressStore store(blocked);
    auto res = store.Record("redis:7.0", AssetStatus::Pushed);
    EXPECT_FALSE(res.is_ok());
    EXPECT_NE(res.message().find("cannot write progress file"), std::string::npos);
    EXPECT_EQ(testutil::ReadFile(blocked + "/keep"), "x");
}

TEST_F(ProgressStoreTest, ResetRemovesOneRecord) {
    ProgressStore store(path);
    store.Load();
    ASSERT_TRUE(store.Record("redis:7.0", AssetStatus::Pushed).is_ok());
    ASSERT_TRUE(store.Record("nginx:1.25", AssetStatus::Pushed).is_ok());

    bool found = false;
    ASSERT_TRUE(store.Reset("redis:7.0", &found).is_ok());
    EXPECT_TRUE(found);
    ASSERT_TRUE(store.Reset("postgres:15", &found).is_ok());
    EXPECT_FALSE(found);

    ProgressStore reloaded(path);
    reloaded.Load();
    EXPECT_EQ(reloaded.StatusOf("redis:7.0"), AssetStatus::Pending);
    EXPECT_EQ(reloaded.StatusOf("nginx:1.25"), AssetStatus::Pushed);
}

TEST_F(ProgressStoreTest, ResetAllEmptiesLedger) {
    ProgressStore store(path);
    store.Load();
    ASSERT_TRUE(store.Record("redis:7.0", AssetStatus::Pushed).is_ok());
    ASSERT_TRUE(store.ResetAll().is_ok());

    ProgressStore reloaded(path);
    EXPECT_TRUE(reloaded.Load().empty());
}

TEST_F(ProgressStoreTest, InvalidUtf8InDetailIsReplaced) {
    ProgressStore store(path);
    store.Load();
    ASSERT_TRUE(store.Record("a:1", AssetStatus::Failed,
                             {.message = "bad \xff byte", .digest = {}, .size = std::nullopt}).is_ok());
    ProgressStore reloaded(path);
    reloaded.Load();
    EXPECT_EQ(reloaded.StatusOf("a:1"), AssetStatus::Failed);
}

TEST(AssetStatusTest, ParseRoundTripsNames) {
    for (auto s : {AssetStatus::Pending, AssetStatus::InProgress, AssetStatus::Pushed, AssetStatus::Failed,
                   AssetStatus::Skipped}) {
        auto parsed = ParseAssetStatus(ToString(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(ParseAssetStatus("PUSHED").has_value());
}

} // namespace
} // namespace uploader
