#include <gtest/gtest.h>
#include "tagreg/config_file.hpp"
#include "tagreg/registry_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

using namespace tagreg;

class RegistryConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir = std::filesystem::temp_directory_path() /
                  ("tagreg_config_test_" + std::string(info->name()) + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
        ::unsetenv("TAGREG_STORE");
        ::unsetenv("TAGREG_KEY_SCHEME");
    }

    void TearDown() override {
        ::unsetenv("TAGREG_STORE");
        ::unsetenv("TAGREG_KEY_SCHEME");
        std::filesystem::remove_all(tempDir);
    }

    std::filesystem::path writeConfig(const std::string& content) {
        auto path = tempDir / "tagreg.conf";
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path tempDir;
};

TEST_F(RegistryConfigTest, Defaults) {
    RegistryConfig config;
    EXPECT_EQ(config.storePath, "types.toml");
    EXPECT_EQ(config.keyScheme, KeyScheme::Auto);
    EXPECT_EQ(config.lockTimeout.count(), 30000);
    EXPECT_EQ(config.maxMintAttempts, 8);
    EXPECT_FALSE(config.verbose);
}

TEST_F(RegistryConfigTest, MissingFileYieldsDefaults) {
    RegistryConfig config = RegistryConfig::fromFile(tempDir / "absent.conf");
    EXPECT_EQ(config.storePath, "types.toml");
    EXPECT_EQ(config.keyScheme, KeyScheme::Auto);
}

TEST_F(RegistryConfigTest, ReadsAllSettings) {
    auto path = writeConfig(
        "# project settings\n"
        "store.path: /abs/store.toml\n"
        "store.key_scheme: legacy\n"
        "lock.timeout_ms: 250\n"
        "mint.max_attempts: 3\n"
        "debug.logging: on\n");

    RegistryConfig config = RegistryConfig::fromFile(path);
    EXPECT_EQ(config.storePath, "/abs/store.toml");
    EXPECT_EQ(config.keyScheme, KeyScheme::Legacy);
    EXPECT_EQ(config.lockTimeout.count(), 250);
    EXPECT_EQ(config.maxMintAttempts, 3);
    EXPECT_TRUE(config.verbose);
}

TEST_F(RegistryConfigTest, RelativeStoreIsBesideConfig) {
    auto path = writeConfig("store.path: build/../data/types.toml\n");

    RegistryConfig config = RegistryConfig::fromFile(path);
    EXPECT_EQ(config.storePath, (tempDir / "data" / "types.toml").lexically_normal());
}

TEST_F(RegistryConfigTest, InvalidValuesThrow) {
    EXPECT_THROW((void)RegistryConfig::fromFile(writeConfig("store.key_scheme: sideways\n")),
                 std::invalid_argument);
    EXPECT_THROW((void)RegistryConfig::fromFile(writeConfig("lock.timeout_ms: soon\n")),
                 std::invalid_argument);
    EXPECT_THROW((void)RegistryConfig::fromFile(writeConfig("lock.timeout_ms: -1\n")),
                 std::invalid_argument);
    EXPECT_THROW((void)RegistryConfig::fromFile(writeConfig("mint.max_attempts: 0\n")),
                 std::invalid_argument);
    EXPECT_THROW((void)RegistryConfig::fromFile(writeConfig("debug.logging: sometimes\n")),
                 std::invalid_argument);
}

TEST_F(RegistryConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig(
        "store.path: from_file.toml\n"
        "store.key_scheme: legacy\n");

    ::setenv("TAGREG_STORE", "/env/types.toml", 1);
    ::setenv("TAGREG_KEY_SCHEME", "qualified", 1);

    RegistryConfig config = RegistryConfig::fromFile(path);
    config.applyEnvironment();
    EXPECT_EQ(config.storePath, "/env/types.toml");
    EXPECT_EQ(config.keyScheme, KeyScheme::Qualified);
}

TEST_F(RegistryConfigTest, EmptyEnvironmentIsIgnored) {
    ::setenv("TAGREG_STORE", "", 1);

    RegistryConfig config;
    config.applyEnvironment();
    EXPECT_EQ(config.storePath, "types.toml");
}

TEST_F(RegistryConfigTest, InvalidEnvironmentSchemeThrows) {
    ::setenv("TAGREG_KEY_SCHEME", "bogus", 1);

    RegistryConfig config;
    EXPECT_THROW(config.applyEnvironment(), std::invalid_argument);
}

TEST_F(RegistryConfigTest, WriteDefaultsRoundTrips) {
    auto path = tempDir / "tagreg.conf";
    EXPECT_TRUE(RegistryConfig::writeDefaults(path));

    ConfigFile file;
    ASSERT_TRUE(file.load(path));
    EXPECT_EQ(file.getString("store.key_scheme"), "auto");
    EXPECT_EQ(file.getInt("mint.max_attempts"), 8);

    RegistryConfig config = RegistryConfig::fromFile(path);
    EXPECT_EQ(config.storePath, (tempDir / "types.toml").lexically_normal());
    EXPECT_EQ(config.keyScheme, KeyScheme::Auto);
    EXPECT_EQ(config.lockTimeout.count(), 30000);
    EXPECT_EQ(config.maxMintAttempts, 8);
    EXPECT_FALSE(config.verbose);
}

TEST_F(RegistryConfigTest, WriteDefaultsKeepsExistingFile) {
    auto path = writeConfig("store.path: mine.toml\n");
    EXPECT_FALSE(RegistryConfig::writeDefaults(path));

    ConfigFile file;
    ASSERT_TRUE(file.load(path));
    EXPECT_EQ(file.getString("store.path"), "mine.toml");
}
