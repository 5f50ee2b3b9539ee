#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "gbe/foundation/common_adapter.hpp"

using namespace gbe::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::DuplicateUnitId), "Roster");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownStatusType), "Roster");
    EXPECT_EQ(errorSubsystem(ErrorCode::PositionConflict), "Grid");
    EXPECT_EQ(errorSubsystem(ErrorCode::BattleFinished), "Battle");
}

// --- BattleError tests ---

TEST(BattleErrorTest, DefaultConstruction) {
    BattleError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.unitId().has_value());
    EXPECT_FALSE(err.abilityId().has_value());
}

TEST(BattleErrorTest, CodeAndMessage) {
    BattleError err(ErrorCode::NotFound, "unit missing");
    EXPECT_EQ(err.code(), ErrorCode::NotFound);
    EXPECT_EQ(err.message(), "unit missing");
    EXPECT_EQ(err.subsystem(), "General");
    EXPECT_FALSE(err.isSuccess());
}

TEST(BattleErrorTest, CarriesOffendingIds) {
    BattleError err(ErrorCode::InvalidAbility, "range too short", "mage", "fireball");
    ASSERT_TRUE(err.unitId().has_value());
    ASSERT_TRUE(err.abilityId().has_value());
    EXPECT_EQ(*err.unitId(), "mage");
    EXPECT_EQ(*err.abilityId(), "fireball");
    EXPECT_EQ(err.subsystem(), "Roster");
}

TEST(BattleErrorTest, SuccessCheck) {
    BattleError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- BattleResult tests ---

TEST(BattleResultTest, OkValue) {
    auto result = BattleResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(BattleResultTest, ErrorValue) {
    auto result = BattleResult<int>::err(
        BattleError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(BattleResultTest, VoidError) {
    auto result = BattleResult<void>::err(BattleError(ErrorCode::EmptyRoster, "no heroes"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::EmptyRoster);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unique directory per test so ctest --parallel runs do not collide
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("gbe_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("engine.yaml", R"(
grid:
  width: 10
  height: 6
random:
  label: "replay-7"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto width = config.get<int>("grid.width");
    ASSERT_TRUE(width.hasValue());
    EXPECT_EQ(width.value(), 10);

    auto label = config.get<std::string>("random.label");
    ASSERT_TRUE(label.hasValue());
    EXPECT_EQ(label.value(), "replay-7");
}

TEST_F(ConfigManagerTest, LoadFromString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("wave:\n  scroll_distance: 4\n").hasValue());

    auto scroll = config.get<int>("wave.scroll_distance");
    ASSERT_TRUE(scroll.hasValue());
    EXPECT_EQ(scroll.value(), 4);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2").hasValue());

    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.load(writeYaml("empty.yaml", "{}")).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.load(writeYaml("types.yaml", "value: hello")).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYaml) {
    ConfigManager config;
    auto result = config.loadFromString("grid: [1, 2");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("battle.max_ticks", 500);

    auto result = config.get<int>("battle.max_ticks");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 500);
}

TEST_F(ConfigManagerTest, KeysAreSorted) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("wave:\n  b: 1\n  a: 2\ngrid:\n  width: 3\n").hasValue());

    auto keys = config.keys();
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "grid.width");
    EXPECT_EQ(keys[1], "wave.a");
    EXPECT_EQ(keys[2], "wave.b");
}
