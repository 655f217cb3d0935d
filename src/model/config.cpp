#include "model/config.hpp"

#include "logging/log_parser.hpp"

#include <fstream>

void applyConfigDefaults(Config& cfg) {
    cfg.queueCapacity = 500;
    cfg.firstTokenId = 1000;
    cfg.logPath.clear();
    cfg.summaryPath.clear();
    cfg.randomSeed = 12345;
    cfg.simulatePatients = 20;
    cfg.simulateDoctors = 3;
    cfg.simulateSlotsPerDoctor = 4;
    cfg.simulateSteps = 60;
}

bool parseConfigFile(const std::string& path, Config& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }
    // Defaults in case some keys are absent.
    applyConfigDefaults(cfg);

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "Missing '=' on line " + std::to_string(lineNo);
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        try {
            if (key == "queueCapacity") cfg.queueCapacity = std::stoi(val);
            else if (key == "firstTokenId") cfg.firstTokenId = std::stoi(val);
            else if (key == "logPath") cfg.logPath = val;
            else if (key == "summaryPath") cfg.summaryPath = val;
            else if (key == "randomSeed") cfg.randomSeed = static_cast<unsigned int>(std::stoul(val));
            else if (key == "simulatePatients") cfg.simulatePatients = std::stoi(val);
            else if (key == "simulateDoctors") cfg.simulateDoctors = std::stoi(val);
            else if (key == "simulateSlotsPerDoctor") cfg.simulateSlotsPerDoctor = std::stoi(val);
            else if (key == "simulateSteps") cfg.simulateSteps = std::stoi(val);
            else {
                err = "Unknown key: " + key;
                return false;
            }
        } catch (const std::exception&) {
            err = "Invalid value for key: " + key;
            return false;
        }
    }
    return validateConfig(cfg, err);
}

bool validateConfig(const Config& cfg, std::string& err) {
    if (cfg.queueCapacity <= 0) {
        err = "queueCapacity must be > 0";
        return false;
    }
    if (cfg.firstTokenId < 0 || cfg.firstTokenId > kMaxFirstTokenId) {
        err = "firstTokenId must be in [0, " + std::to_string(kMaxFirstTokenId) + "]";
        return false;
    }
    if (cfg.simulatePatients <= 0 || cfg.simulateDoctors <= 0 || cfg.simulateSlotsPerDoctor <= 0) {
        err = "simulatePatients/simulateDoctors/simulateSlotsPerDoctor must be > 0";
        return false;
    }
    if (cfg.simulateSteps < 0) {
        err = "simulateSteps must be >= 0";
        return false;
    }
    return true;
}

bool loadConfig(const std::vector<std::string>& candidates, Config& cfg, std::string& loadedPath, std::string& err) {
    loadedPath.clear();
    for (const std::string& path : candidates) {
        if (!std::ifstream(path)) {
            continue;
        }
        if (!parseConfigFile(path, cfg, err)) {
            err = path + ": " + err;
            return false;
        }
        loadedPath = path;
        return true;
    }
    applyConfigDefaults(cfg);
    return validateConfig(cfg, err);
}
