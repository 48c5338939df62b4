#include <gtest/gtest.h>
#include "fineview/compiler_cache_options.hpp"
#include "fineview/config_file.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace fineview;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "fineview_config_file_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    std::filesystem::path tempDir;
};

// ============================================================================
// ConfigFile
// ============================================================================

TEST_F(ConfigFileTest, LoadTypedValues) {
    auto path = tempDir / "typed.conf";
    {
        std::ofstream file(path);
        file << "# Header comment\n";
        file << "\n";
        file << "name: Test\n";
        file << "count: 42\n";
        file << "mask: 0x1F\n";
        file << "ratio: 0.5\n";
        file << "enabled: yes\n";
        file << "disabled: false\n";
    }

    ConfigFile config;
    ASSERT_TRUE(config.load(path));
    EXPECT_TRUE(config.isLoaded());
    EXPECT_EQ(config.path(), path);
    EXPECT_EQ(config.size(), 6u);

    EXPECT_EQ(config.getString("name"), "Test");
    EXPECT_EQ(config.getInt("count"), 42);
    EXPECT_EQ(config.getInt("mask"), 31);
    EXPECT_DOUBLE_EQ(config.getFloat("ratio"), 0.5);
    EXPECT_DOUBLE_EQ(config.getFloat("count"), 42.0);
    EXPECT_TRUE(config.getBool("enabled"));
    EXPECT_FALSE(config.getBool("disabled", true));
}

TEST_F(ConfigFileTest, MissingFileFailsToLoad) {
    ConfigFile config;
    EXPECT_FALSE(config.load(tempDir / "missing.conf"));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_EQ(config.size(), 0u);
}

TEST_F(ConfigFileTest, DefaultsForMissingOrMistypedKeys) {
    ConfigFile config;
    config.parse("name: Test\ncount: 42\n");

    EXPECT_EQ(config.getString("missing", "fallback"), "fallback");
    EXPECT_EQ(config.getInt("name", 7), 7);
    EXPECT_EQ(config.getString("count", "x"), "x");
    EXPECT_TRUE(config.getBool("count", true));
}

TEST_F(ConfigFileTest, ParseSkipsCommentsAndIndentedLines) {
    ConfigFile config;
    config.parse("# comment: ignored\n"
                 "  indented: ignored\n"
                 "no colon here\n"
                 "empty:\n"
                 "key:   spaced value   \r\n");

    EXPECT_FALSE(config.has("# comment"));
    EXPECT_FALSE(config.has("indented"));
    EXPECT_FALSE(config.has("empty"));
    EXPECT_EQ(config.getString("key"), "spaced value");
    EXPECT_EQ(config.size(), 1u);
}

TEST_F(ConfigFileTest, LaterLinesOverrideEarlier) {
    ConfigFile config;
    config.parse("count: 1\ncount: 2\n");
    EXPECT_EQ(config.getInt("count"), 2);
}

// ============================================================================
// CompilerCacheOptions
// ============================================================================

TEST_F(ConfigFileTest, OptionDefaults) {
    CompilerCacheOptions options;
    EXPECT_EQ(options.importFileName, "_ViewImports.cshtml");
    EXPECT_FALSE(options.caseSensitive);
    EXPECT_FALSE(options.debugLogging);
    EXPECT_NO_THROW(options.validate());
}

TEST_F(ConfigFileTest, OptionsFromConfig) {
    ConfigFile config;
    config.parse("cache.import_file_name: _Imports.razor\n"
                 "cache.case_sensitive: true\n");

    auto options = CompilerCacheOptions::fromConfig(config);
    EXPECT_EQ(options.importFileName, "_Imports.razor");
    EXPECT_TRUE(options.caseSensitive);
    EXPECT_FALSE(options.debugLogging);
}

TEST_F(ConfigFileTest, LoadOptionsFromFile) {
    auto path = tempDir / "fineview.conf";
    {
        std::ofstream file(path);
        file << "# fineview settings\n";
        file << "cache.case_sensitive: yes\n";
    }

    auto options = CompilerCacheOptions::load(path);
    EXPECT_TRUE(options.caseSensitive);
    EXPECT_EQ(options.importFileName, "_ViewImports.cshtml");
}

TEST_F(ConfigFileTest, LoadOptionsFromMissingFileGivesDefaults) {
    auto options = CompilerCacheOptions::load(tempDir / "missing.conf");
    EXPECT_EQ(options.importFileName, "_ViewImports.cshtml");
    EXPECT_FALSE(options.caseSensitive);
}

TEST_F(ConfigFileTest, ValidateRejectsBadImportFileName) {
    CompilerCacheOptions options;
    options.importFileName = "";
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options.importFileName = "Views/_ViewImports.cshtml";
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options.importFileName = "Views\\_ViewImports.cshtml";
    EXPECT_THROW(options.validate(), std::invalid_argument);
}
