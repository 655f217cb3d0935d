#include "logging/log_parser.hpp"

#include <cctype>
#include <sstream>

int toIntSafe(const std::string& s) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return 0;
    }
}

bool extractInt(const std::string& text, const std::string& key, int& out) {
    size_t pos = 0;
    while (true) {
        pos = text.find(key, pos);
        if (pos == std::string::npos) return false;
        // Ensure we're not matching a substring inside another token (e.g. "slot=" vs "id=").
        if (pos > 0 && std::isalnum(static_cast<unsigned char>(text[pos - 1]))) {
            pos += key.size();
            continue;
        }
        pos += key.size();
        bool negative = false;
        if (pos < text.size() && text[pos] == '-') {
            negative = true;
            ++pos;
        }
        long val = 0;
        bool found = false;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            val = val * 10 + (text[pos] - '0');
            found = true;
            ++pos;
        }
        if (found) {
            out = static_cast<int>(negative ? -val : val);
        }
        return found;
    }
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, delim)) {
        parts.push_back(item);
    }
    return parts;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

namespace {
int fieldValue(const std::string& field) {
    size_t eq = field.find('=');
    if (eq == std::string::npos) return 0;
    return toIntSafe(field.substr(eq + 1));
}

std::string joinFrom(const std::vector<std::string>& parts, size_t first) {
    std::string joined;
    for (size_t i = first; i < parts.size(); ++i) {
        if (i > first) joined.push_back(';');
        joined += parts[i];
    }
    return joined;
}
} // namespace

bool parseLogLine(const std::string& line, LogEntry& out) {
    auto parts = split(line, ';');
    if (parts.size() < 3) {
        return false;
    }
    try {
        out.seq = std::stoll(parts[0]);
    } catch (const std::exception&) {
        return false;
    }

    if (parts.size() >= 7 && parts[1].rfind("rQ=", 0) == 0) {
        out.hasMetrics = true;
        // rQ is len/cap
        auto slashPos = parts[1].find('/');
        if (slashPos != std::string::npos) {
            out.routineQueueLen = toIntSafe(parts[1].substr(3, slashPos - 3));
            out.routineQueueCapacity = toIntSafe(parts[1].substr(slashPos + 1));
        } else {
            out.routineQueueLen = fieldValue(parts[1]);
        }
        out.triageLen = fieldValue(parts[2]);
        out.undoDepth = fieldValue(parts[3]);
        out.servedCount = fieldValue(parts[4]);
        out.role = parts[5];
        out.text = joinFrom(parts, 6);
    } else {
        out.hasMetrics = false;
        out.role = parts[1];
        out.text = joinFrom(parts, 2);
    }
    return true;
}
