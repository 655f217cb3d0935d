#pragma once

#include <string>
#include <vector>

struct LogEntry {
    long long seq{0};
    bool hasMetrics{false};
    int routineQueueLen{0};
    int routineQueueCapacity{0};
    int triageLen{0};
    int undoDepth{0};
    int servedCount{0};
    std::string role;
    std::string text;
};

/** @brief Safe stoi returning 0 on failure. */
int toIntSafe(const std::string& s);

/** @brief Extract integer value for a given key ("id=") in free-form text. */
bool extractInt(const std::string& text, const std::string& key, int& out);

/** @brief Split string by delimiter into parts. */
std::vector<std::string> split(const std::string& line, char delim);

/** @brief Strip leading/trailing whitespace. */
std::string trim(const std::string& s);

/** @brief Parse a log line into a LogEntry (with or without the metrics fields). */
bool parseLogLine(const std::string& line, LogEntry& out);
