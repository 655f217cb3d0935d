#pragma once

#include <string>

#include "model/types.hpp"

/**
 * @brief Append-only text log writing one line per event to a file descriptor.
 */
class Logger {
public:
    /** @brief Default constructor leaves fd closed. */
    Logger();

    /**
     * @brief Construct and open a log file immediately.
     * @param path file path to open/create.
     */
    explicit Logger(const std::string& path);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Open or create the log file in append mode.
     * @param path file path.
     * @return true on success, false on failure.
     */
    bool openFile(const std::string& path);

    /**
     * @brief Write one log line (a newline is appended).
     * @param line text to write.
     * @return false when the file is closed or the write failed.
     */
    bool logLine(const std::string& line);

    /**
     * @brief Close the file descriptor if open.
     */
    void closeFile();

    bool isOpen() const { return fd != -1; }

private:
    int fd;
};

/**
 * @brief Clinic load figures prefixed to every log line.
 */
struct LogMetrics {
    int routineQueueLen{0};
    int routineQueueCapacity{0};
    int triageLen{0};
    int undoDepth{0};
    int servedCount{0};
};

/**
 * @brief Build a semicolon-separated log line:
 *        seq;rQ=len/cap;tQ=len;uD=depth;served=n;role;text
 * @param metrics load figures, or null to omit the metrics fields.
 */
std::string formatLogLine(long long seq, Role role, const LogMetrics* metrics, const std::string& text);
