#include <gtest/gtest.h>
#include "chunkup/core/config.hpp"
#include "chunkup/transfer/upload_manager.hpp"
#include <fstream>
#include <filesystem>

using namespace chunkup::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_chunkup_config.txt";
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

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
    EXPECT_FALSE(config.get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "yes");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int.bad", "42abc");
    config.set("size.value", "5368709120");
    config.set("size.negative", "-5");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_int("int.bad", 7), 7);
    EXPECT_EQ(config.get_uint64("size.value"), 5368709120ULL);
    EXPECT_EQ(config.get_uint64("size.negative", 9), 9u);
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, SetDefaultsSeedsUploadSettings) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_uint64("upload.chunk_size"), 5u * 1024 * 1024);
    EXPECT_EQ(config.get_int("upload.max_retries"), 3);
    EXPECT_EQ(config.get_int("upload.session_ttl_hours"), 24);
    EXPECT_EQ(config.get_uint64("upload.max_file_size"), 2147483648ULL);
    EXPECT_EQ(config.get_string("upload.mode"), "balanced");
    EXPECT_EQ(config.get_int("server.port"), 9440);
}

TEST_F(ConfigTest, ManagerOptionsFromConfig) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("upload.chunk_size", "1024");
    config.set("upload.concurrency", "4");
    config.set("upload.max_retries", "5");
    config.set("store.lease_seconds", "60");

    auto options = chunkup::transfer::ManagerOptions::from_config(config);
    EXPECT_EQ(options.chunk_size, 1024u);
    EXPECT_EQ(options.max_concurrency, 4u);
    EXPECT_EQ(options.max_retries, 5u);
    EXPECT_EQ(options.session_ttl, std::chrono::hours(24));
    EXPECT_EQ(options.lease_duration, std::chrono::seconds(60));

    config.set("upload.concurrency", "0");
    EXPECT_EQ(chunkup::transfer::ManagerOptions::from_config(config).max_concurrency, 1u);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "key1=value1\n";
    file << "key2 = value2 \n";
    file << "   \n";
    file << "no separator\n";
    file << "int.setting=100\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_EQ(config.get_int("int.setting"), 100);
    EXPECT_FALSE(config.has("no separator"));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}
