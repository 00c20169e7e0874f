#include <gtest/gtest.h>
#include "colony/colony_config.hpp"

#include <filesystem>
#include <fstream>

using namespace edupath;

static std::string writeTemp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

TEST(ColonyConfigTest, Defaults) {
    ColonyConfig c;
    EXPECT_DOUBLE_EQ(c.alpha, 1.0);
    EXPECT_DOUBLE_EQ(c.beta, 2.0);
    EXPECT_DOUBLE_EQ(c.evaporation_rate, 0.1);
    EXPECT_DOUBLE_EQ(c.reinforcement_factor, 1.0);
    EXPECT_EQ(c.max_iterations, 100);
    EXPECT_EQ(c.max_path_length, 10);
    EXPECT_FALSE(c.random_seed.has_value());
    EXPECT_NO_THROW(c.validate());
}

TEST(ColonyConfigTest, ValidateRejectsOutOfRange) {
    ColonyConfig c;
    c.evaporation_rate = -0.1;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = ColonyConfig{};
    c.max_iterations = 0;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = ColonyConfig{};
    c.beta = -1.0;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = ColonyConfig{};
    c.max_path_length = 0;
    EXPECT_THROW(c.validate(), std::invalid_argument);
}

TEST(ColonyConfigTest, PartialResolveKeepsDefaults) {
    PartialColonyConfig partial;
    partial.beta = 3.0;
    partial.max_iterations = 25;

    ColonyConfig c = partial.resolve();
    EXPECT_DOUBLE_EQ(c.alpha, 1.0);
    EXPECT_DOUBLE_EQ(c.beta, 3.0);
    EXPECT_EQ(c.max_iterations, 25);
    EXPECT_DOUBLE_EQ(c.evaporation_rate, 0.1);
}

TEST(ColonyConfigTest, FromJson) {
    auto doc = nlohmann::json::parse(R"({
        "alpha": 1.5, "evaporationRate": 0.2, "maxIterations": 60,
        "randomSeed": 17, "unrelated": "ignored"
    })");
    ColonyConfig c = PartialColonyConfig::fromJson(doc).resolve();
    EXPECT_DOUBLE_EQ(c.alpha, 1.5);
    EXPECT_DOUBLE_EQ(c.evaporation_rate, 0.2);
    EXPECT_EQ(c.max_iterations, 60);
    ASSERT_TRUE(c.random_seed.has_value());
    EXPECT_EQ(*c.random_seed, 17u);
    EXPECT_DOUBLE_EQ(c.beta, 2.0);
}

TEST(ColonyConfigTest, LoadMissingFileUsesDefaults) {
    ColonyConfig c = loadColonyConfigOrDefault("/nonexistent/edupath/config.json");
    EXPECT_DOUBLE_EQ(c.alpha, 1.0);
    EXPECT_EQ(c.max_iterations, 100);
}

TEST(ColonyConfigTest, LoadFile) {
    std::string path = writeTemp("edupath_config.json",
                                 R"({"beta": 1.0, "reinforcementFactor": 2.5})");
    ColonyConfig c = loadColonyConfigOrDefault(path);
    EXPECT_DOUBLE_EQ(c.beta, 1.0);
    EXPECT_DOUBLE_EQ(c.reinforcement_factor, 2.5);
    std::filesystem::remove(path);
}

TEST(ColonyConfigTest, LoadInvalidValuesUsesDefaults) {
    std::string path = writeTemp("edupath_bad_config.json",
                                 R"({"evaporationRate": 4.0, "beta": 1.0})");
    ColonyConfig c = loadColonyConfigOrDefault(path);
    EXPECT_DOUBLE_EQ(c.evaporation_rate, 0.1);
    EXPECT_DOUBLE_EQ(c.beta, 2.0);
    std::filesystem::remove(path);

    path = writeTemp("edupath_typed_config.json", R"({"alpha": "high"})");
    c = loadColonyConfigOrDefault(path);
    EXPECT_DOUBLE_EQ(c.alpha, 1.0);
    std::filesystem::remove(path);
}
