#include <gtest/gtest.h>
#include "ginseng/core/config.hpp"
#include <fstream>
#include <filesystem>

using namespace ginseng::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_ginseng_config.conf";
    }
    
    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();
    
    config.set("node.home", "/tmp/node");
    
    auto value = config.get("node.home");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "/tmp/node");
    EXPECT_FALSE(config.get("missing.key").has_value());
}

TEST_F(ConfigTest, TypedGetters) {
    auto& config = Config::instance();
    
    config.set("flag.on", "yes");
    config.set("flag.off", "false");
    config.set("transfer.download_concurrency", "4");
    config.set("broken.int", "4 workers");
    
    EXPECT_TRUE(config.get_bool("flag.on"));
    EXPECT_FALSE(config.get_bool("flag.off", true));
    EXPECT_EQ(config.get_int("transfer.download_concurrency"), 4);
    EXPECT_EQ(config.get_int("broken.int", 7), 7);
    EXPECT_EQ(config.get_string("missing", "fallback"), "fallback");
}

TEST_F(ConfigTest, DefaultsCoverTransferKeys) {
    auto& config = Config::instance();
    config.set_defaults();
    
    EXPECT_EQ(config.get_int("transfer.upload_concurrency", -1), 0);
    EXPECT_EQ(config.get_int("transfer.download_concurrency"), 6);
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 65536);
    EXPECT_EQ(config.get_int("progress.emit_interval_ms"), 100);
    EXPECT_EQ(config.get_string("node.home"), "~/.ginseng");
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_EQ(config.get_string("output.format"), "text");
    EXPECT_EQ(config.get_string("download.directory", "unset"), "");
}

TEST_F(ConfigTest, LoadFromFileSkipsCommentsAndTrims) {
    std::ofstream file(test_file);
    file << "# Ginseng node\n";
    file << "\n";
    file << "node.home = /srv/ginseng  \n";
    file << "transfer.chunk_size=4096\n";
    file << "not a setting\n";
    file.close();
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_string("node.home"), "/srv/ginseng");
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 4096);
    EXPECT_FALSE(config.get("not a setting").has_value());
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveAndReload) {
    auto& config = Config::instance();
    config.set("b.key", "2");
    config.set("a.key", "1");
    ASSERT_TRUE(config.save_to_file(test_file));
    
    std::ifstream file(test_file);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_LT(content.find("a.key=1"), content.find("b.key=2"));
    
    config.clear();
    ASSERT_TRUE(config.load_from_file(test_file));
    EXPECT_EQ(config.get_string("a.key"), "1");
    EXPECT_EQ(config.get_string("b.key"), "2");
}
