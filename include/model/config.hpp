#pragma once

#include <string>
#include <vector>

/** Largest accepted firstTokenId; leaves room for a billion tokens below INT_MAX. */
constexpr int kMaxFirstTokenId = 1000000000;

struct Config {
    int queueCapacity;
    int firstTokenId;
    std::string logPath;       // empty disables the log file
    std::string summaryPath;   // empty disables the summary file
    unsigned int randomSeed;
    int simulatePatients;
    int simulateDoctors;
    int simulateSlotsPerDoctor;
    int simulateSteps;
};

/** @brief Fill cfg with built-in defaults. */
void applyConfigDefaults(Config& cfg);

/**
 * @brief Load key/value pairs from config file with defaults and validation.
 * @param path path to config file.
 * @param cfg destination structure to fill.
 * @param err error message on failure.
 * @return true if parsed and validated, false otherwise.
 */
bool parseConfigFile(const std::string& path, Config& cfg, std::string& err);

/**
 * @brief Validate already-populated values.
 * @return true when valid, otherwise false with err set.
 */
bool validateConfig(const Config& cfg, std::string& err);

/**
 * @brief Load the first config file that can be opened.
 *
 * A candidate that cannot be opened is skipped. Once one opens, its parse or
 * validation result is final: a bad file is reported, never replaced by the
 * next candidate or by defaults. When no candidate opens, validated built-in
 * defaults are used.
 *
 * @param loadedPath receives the file used, empty when defaults were used.
 * @return false with err set when the opened file is invalid.
 */
bool loadConfig(const std::vector<std::string>& candidates, Config& cfg, std::string& loadedPath, std::string& err);
