#include "model/config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace {
class ConfigFile {
public:
    explicit ConfigFile(const std::string& content)
        : path("clinic_test_" + std::to_string(counter++) + ".cfg") {
        std::ofstream out(path);
        out << content;
    }
    ~ConfigFile() { std::remove(path.c_str()); }

    std::string path;

private:
    static int counter;
};
int ConfigFile::counter = 0;
} // namespace

TEST(Config, DefaultsForAbsentKeys) {
    ConfigFile file("# only capacity\nqueueCapacity = 25\n\n");
    Config cfg{};
    std::string err;
    ASSERT_TRUE(parseConfigFile(file.path, cfg, err)) << err;
    EXPECT_EQ(cfg.queueCapacity, 25);
    EXPECT_EQ(cfg.firstTokenId, 1000);
    EXPECT_TRUE(cfg.logPath.empty());
    EXPECT_EQ(cfg.randomSeed, 12345u);
    EXPECT_EQ(cfg.simulateSteps, 60);
}

TEST(Config, ReadsEveryKey) {
    ConfigFile file(
        "queueCapacity=3\nfirstTokenId=1\nlogPath=run.log\nsummaryPath=sum.txt\n"
        "randomSeed=7\nsimulatePatients=4\nsimulateDoctors=2\nsimulateSlotsPerDoctor=5\nsimulateSteps=0\n");
    Config cfg{};
    std::string err;
    ASSERT_TRUE(parseConfigFile(file.path, cfg, err)) << err;
    EXPECT_EQ(cfg.queueCapacity, 3);
    EXPECT_EQ(cfg.firstTokenId, 1);
    EXPECT_EQ(cfg.logPath, "run.log");
    EXPECT_EQ(cfg.summaryPath, "sum.txt");
    EXPECT_EQ(cfg.randomSeed, 7u);
    EXPECT_EQ(cfg.simulatePatients, 4);
    EXPECT_EQ(cfg.simulateDoctors, 2);
    EXPECT_EQ(cfg.simulateSlotsPerDoctor, 5);
    EXPECT_EQ(cfg.simulateSteps, 0);
}

TEST(Config, RejectsInvalidValues) {
    Config cfg{};
    std::string err;

    ConfigFile zeroCapacity("queueCapacity=0\n");
    EXPECT_FALSE(parseConfigFile(zeroCapacity.path, cfg, err));
    EXPECT_EQ(err, "queueCapacity must be > 0");

    ConfigFile notNumber("firstTokenId=abc\n");
    EXPECT_FALSE(parseConfigFile(notNumber.path, cfg, err));
    EXPECT_EQ(err, "Invalid value for key: firstTokenId");

    ConfigFile unknown("waitingRoom=4\n");
    EXPECT_FALSE(parseConfigFile(unknown.path, cfg, err));
    EXPECT_EQ(err, "Unknown key: waitingRoom");

    ConfigFile noEquals("queueCapacity 4\n");
    EXPECT_FALSE(parseConfigFile(noEquals.path, cfg, err));
    EXPECT_EQ(err, "Missing '=' on line 1");
}

TEST(Config, MissingFileReportsPath) {
    Config cfg{};
    std::string err;
    EXPECT_FALSE(parseConfigFile("does_not_exist.cfg", cfg, err));
    EXPECT_EQ(err, "Cannot open config file: does_not_exist.cfg");
}

TEST(Config, FirstTokenIdIsBounded) {
    Config cfg{};
    std::string err;
    ConfigFile atLimit("firstTokenId=" + std::to_string(kMaxFirstTokenId) + "\n");
    EXPECT_TRUE(parseConfigFile(atLimit.path, cfg, err)) << err;

    ConfigFile aboveLimit("firstTokenId=2147483647\n");
    EXPECT_FALSE(parseConfigFile(aboveLimit.path, cfg, err));
    EXPECT_EQ(err, "firstTokenId must be in [0, " + std::to_string(kMaxFirstTokenId) + "]");
}

TEST(ConfigLookup, InvalidFirstCandidateIsReportedNotSkipped) {
    ConfigFile bad("queueCapacity=0\n");
    ConfigFile good("queueCapacity=9\n");
    Config cfg{};
    std::string loaded;
    std::string err;
    EXPECT_FALSE(loadConfig({bad.path, good.path}, cfg, loaded, err));
    EXPECT_EQ(err, bad.path + ": queueCapacity must be > 0");
    EXPECT_TRUE(loaded.empty());
}

TEST(ConfigLookup, MisspelledKeyIsReported) {
    ConfigFile typo("simulateDoctrs=3\n");
    Config cfg{};
    std::string loaded;
    std::string err;
    EXPECT_FALSE(loadConfig({typo.path}, cfg, loaded, err));
    EXPECT_EQ(err, typo.path + ": Unknown key: simulateDoctrs");
}

TEST(ConfigLookup, SkipsCandidatesThatCannotBeOpened) {
    ConfigFile good("queueCapacity=9\n");
    Config cfg{};
    std::string loaded;
    std::string err;
    ASSERT_TRUE(loadConfig({"missing_clinic.cfg", good.path}, cfg, loaded, err)) << err;
    EXPECT_EQ(loaded, good.path);
    EXPECT_EQ(cfg.queueCapacity, 9);
}

TEST(ConfigLookup, FallsBackToDefaultsWhenNothingOpens) {
    Config cfg{};
    std::string loaded = "stale";
    std::string err;
    ASSERT_TRUE(loadConfig({"missing_a.cfg", "missing_b.cfg"}, cfg, loaded, err)) << err;
    EXPECT_TRUE(loaded.empty());
    EXPECT_EQ(cfg.queueCapacity, 500);
    EXPECT_EQ(cfg.firstTokenId, 1000);
}
