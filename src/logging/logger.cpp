#include "logging/logger.hpp"

#include "util/error.hpp"

#include <fcntl.h>
#include <unistd.h>

Logger::Logger() : fd(-1) {}

Logger::Logger(const std::string& path) : fd(-1) {
    openFile(path);
}

Logger::~Logger() {
    closeFile();
}

bool Logger::openFile(const std::string& path) {
    if (fd != -1) {
        closeFile();
    }
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) {
        logErrno("open log file failed: " + path);
        return false;
    }
    return true;
}

bool Logger::logLine(const std::string& line) {
    if (fd == -1) {
        logError("logLine called with closed fd");
        return false;
    }
    std::string withNewline = line;
    withNewline.push_back('\n');
    ssize_t written = ::write(fd, withNewline.data(), withNewline.size());
    if (written == -1) {
        logErrno("write failed");
        return false;
    }
    return true;
}

void Logger::closeFile() {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

std::string formatLogLine(long long seq, Role role, const LogMetrics* metrics, const std::string& text) {
    std::string line = std::to_string(seq) + ";";
    if (metrics) {
        line += "rQ=" + std::to_string(metrics->routineQueueLen) + "/" +
                std::to_string(metrics->routineQueueCapacity) + ";"
              + "tQ=" + std::to_string(metrics->triageLen) + ";"
              + "uD=" + std::to_string(metrics->undoDepth) + ";"
              + "served=" + std::to_string(metrics->servedCount) + ";";
    }
    line += roleLabel(role) + ";" + text;
    return line;
}
