#include <gtest/gtest.h>
#include "Config.h"
#include "AgentSuite.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace BehaviorSentinel;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("behavior_sentinel_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST(ConfigTest, TypedAccessors) {
    Config config;
    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));
    EXPECT_EQ(config.get("key2", "fallback"), "fallback");

    config.setInt("intKey", 42);
    EXPECT_EQ(config.getInt("intKey"), 42);

    config.setSize("sizeKey", 120000);
    EXPECT_EQ(config.getSize("sizeKey"), 120000u);

    config.setBool("boolKey", true);
    EXPECT_TRUE(config.getBool("boolKey"));

    config.setDouble("doubleKey", 0.25);
    EXPECT_DOUBLE_EQ(config.getDouble("doubleKey"), 0.25);
}

TEST(ConfigTest, MalformedValuesFallBackToDefault) {
    Config config;
    config.set("int", "abc");
    config.set("size", "-5");
    config.set("bool", "maybe");
    config.set("double", "x1");
    EXPECT_EQ(config.getInt("int", 7), 7);
    EXPECT_EQ(config.getSize("size", 9), 9u);
    EXPECT_TRUE(config.getBool("bool", true));
    EXPECT_DOUBLE_EQ(config.getDouble("double", 1.5), 1.5);
    EXPECT_EQ(config.getInt("missing", 3), 3);
}

TEST(ConfigTest, BoolSpellings) {
    Config config;
    config.set("a", "YES");
    config.set("b", "off");
    config.set("c", "1");
    EXPECT_TRUE(config.getBool("a"));
    EXPECT_FALSE(config.getBool("b", true));
    EXPECT_TRUE(config.getBool("c"));
}

TEST_F(ConfigFileTest, LoadSkipsCommentsAndBlankLines) {
    std::string path = write("engine.conf",
        "# comment\n"
        "\n"
        "touch.window_size = 30\n"
        "  usage.hash_app_ids=true  \n"
        "not a setting\n"
        "log.file =\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path).ok());
    EXPECT_EQ(config.getSize("touch.window_size"), 30u);
    EXPECT_TRUE(config.getBool("usage.hash_app_ids"));
    EXPECT_TRUE(config.hasKey("log.file"));
    EXPECT_EQ(config.get("log.file", "unset"), "");
    EXPECT_FALSE(config.hasKey("not a setting"));
}

TEST_F(ConfigFileTest, SaveThenLoad) {
    Config config;
    config.set("store.path", "/tmp/baselines.db");
    config.setDouble("fusion.weight.touch", 0.5);

    std::string path = (dir_ / "saved.conf").string();
    ASSERT_TRUE(config.saveToFile(path).ok());

    Config reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path).ok());
    EXPECT_EQ(reloaded.get("store.path"), "/tmp/baselines.db");
    EXPECT_DOUBLE_EQ(reloaded.getDouble("fusion.weight.touch"), 0.5);
}

TEST_F(ConfigFileTest, LayeredLoadOverridesInOrder) {
    std::string base = write("base.conf", "touch.window_size = 50\ntyping.window_size = 50\n");
    std::string local = write("local.conf", "touch.window_size = 20\n");

    Config config;
    EXPECT_TRUE(config.loadLayered({base, (dir_ / "absent.conf").string(), local}));
    EXPECT_EQ(config.getSize("touch.window_size"), 20u);
    EXPECT_EQ(config.getSize("typing.window_size"), 50u);

    Config keepFirst;
    EXPECT_TRUE(keepFirst.loadLayered({base, local}, false));
    EXPECT_EQ(keepFirst.getSize("touch.window_size"), 50u);
}

TEST_F(ConfigFileTest, MissingFileIsConfigError) {
    Config config;
    auto loaded = config.loadFromFile((dir_ / "missing.conf").string());
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code, ErrorCode::ConfigError);
    EXPECT_FALSE(config.loadLayered({(dir_ / "missing.conf").string()}));
}

TEST(ConfigTest, ValidateRunsSchemaOnPresentKeys) {
    Config config;
    config.set("port", "8080");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["port"] = [](const std::string&, const std::string& v) { return v == "8080"; };
    schema["absent"] = [](const std::string&, const std::string&) { return false; };
    EXPECT_TRUE(config.validate(schema).ok());

    config.set("port", "0");
    auto result = config.validate(schema);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
    EXPECT_NE(result.error().message.find("port"), std::string::npos);
}

TEST(ConfigTest, EngineValidation) {
    Config config;
    EXPECT_TRUE(validateConfig(config).ok());

    config.set("touch.window_size", "0");
    EXPECT_FALSE(validateConfig(config).ok());

    config.set("touch.window_size", "30");
    config.set("fusion.weight.typing", "-0.3");
    EXPECT_FALSE(validateConfig(config).ok());

    config.set("fusion.weight.typing", "0.3");
    config.set("usage.rate_window_ms", "2m");
    EXPECT_FALSE(validateConfig(config).ok());

    config.set("usage.rate_window_ms", "60000");
    EXPECT_TRUE(validateConfig(config).ok());
}

TEST(ConfigTest, SuiteSettingsFromConfig) {
    Config config;
    config.set("touch.warmup_gestures", "8");
    config.set("typing.warmup_keystrokes", "40");
    config.set("usage.rate_window_ms", "60000");
    config.set("usage.hash_app_ids", "true");
    config.set("fusion.weight.touch", "2");
    config.set("response.min_score_delta", "0.2");

    auto settings = AgentSuite::Settings::fromConfig(config);
    EXPECT_EQ(settings.touch.warmupGestures, 8u);
    EXPECT_EQ(settings.touch.windowSize, 50u);
    EXPECT_EQ(settings.typing.warmupKeystrokes, 40u);
    EXPECT_EQ(settings.usage.rateWindowMs, 60000);
    EXPECT_TRUE(settings.usage.hashAppIds);
    EXPECT_DOUBLE_EQ(settings.weights.touch, 2.0);
    EXPECT_DOUBLE_EQ(settings.weights.typing, 0.3);
    EXPECT_DOUBLE_EQ(settings.response.minScoreDelta, 0.2);
    EXPECT_EQ(settings.response.minAlertIntervalMs, 60000);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
