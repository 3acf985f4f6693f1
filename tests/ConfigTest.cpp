#include <gtest/gtest.h>

#include <string>

#include "TestUtils.hpp"
#include "core/Config.hpp"
#include "utils/FileUtils.hpp"

using homestream::core::Config;
using homestream::test::TempDir;
using homestream::utils::FileUtils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::instance().setDefaults(); }
    void TearDown() override { Config::instance().setDefaults(); }
};

TEST_F(ConfigTest, DefaultsAreAddressedWithDots) {
    auto& config = Config::instance();
    EXPECT_EQ(config.get<int>("server.port"), 9032);
    EXPECT_EQ(config.get<std::string>("togo.errorMode"), "first");
    EXPECT_EQ(config.get<int>("togo.maxAttempts"), 3);
    EXPECT_EQ(config.get<int>("no.such.key", 7), 7);
    EXPECT_TRUE(config.section("receivers").empty());
    EXPECT_TRUE(config.section("missing").is_object());
}

TEST_F(ConfigTest, LoadMergesOverDefaults) {
    TempDir dir;
    auto path = dir.write("homestream.json", R"({
        "server": {"port": 9100},
        "shares": {"Movies": "/srv/movies"},
        "togo": {"errorMode": "all"}
    })");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<int>("server.port"), 9100);
    EXPECT_EQ(config.get<std::string>("server.address"), "0.0.0.0");
    EXPECT_EQ(config.get<std::string>("shares.Movies"), "/srv/movies");
    EXPECT_EQ(config.get<std::string>("togo.errorMode"), "all");
    EXPECT_EQ(config.path(), path.string());
}

TEST_F(ConfigTest, LoadRejectsBrokenFiles) {
    TempDir dir;
    auto path = dir.write("broken.json", "{ not json");
    EXPECT_FALSE(Config::instance().load(path.string()));
    EXPECT_FALSE(Config::instance().load((dir.path() / "absent.json").string()));
}

TEST_F(ConfigTest, SaveWritesEverything) {
    TempDir dir;
    auto& config = Config::instance();
    config.set("togo.concurrency", 4);

    auto path = dir.path() / "nested" / "homestream.json";
    ASSERT_TRUE(config.save(path.string()));

    auto saved = nlohmann::json::parse(*FileUtils::readFile(path));
    EXPECT_EQ(saved["togo"]["concurrency"], 4);
}

TEST(FileUtilsTest, MoveToUniquePathNeverReplaces) {
    TempDir dir;
    auto first = dir.write("a.part", "one");
    auto second = dir.write("b.part", "two");
    auto out = dir.path() / "out";
    FileUtils::createDirectories(out);

    auto p1 = FileUtils::moveToUniquePath(first, out, "Show", ".ts");
    auto p2 = FileUtils::moveToUniquePath(second, out, "Show", ".ts");

    ASSERT_TRUE(p1.has_value());
    ASSERT_TRUE(p2.has_value());
    EXPECT_EQ(p1->filename().string(), "Show.ts");
    EXPECT_EQ(p2->filename().string(), "Show (2).ts");
    EXPECT_EQ(FileUtils::readFile(*p1), std::string("one"));
    EXPECT_EQ(FileUtils::readFile(*p2), std::string("two"));
    EXPECT_FALSE(FileUtils::fileExists(first));
}
