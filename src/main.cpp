#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "clinic.hpp"
#include "cli/command_script.hpp"
#include "cli/workload.hpp"
#include "logging/logger.hpp"
#include "model/config.hpp"
#include "report/report.hpp"
#include "util/error.hpp"

namespace {
void printUsage(const char* self) {
    std::cerr << "Usage: " << self << " [--config <path>] <mode>\n"
              << "  demo                 sample bookings, triage, serves and undo\n"
              << "  run <script|->       execute a command script (- reads stdin)\n"
              << "  simulate             seeded random workload, then a summary\n"
              << "  log-summary <log>    count event log lines per role\n";
}

/**
 * @brief Resolve configuration: explicit path, else config.cfg, else
 *        ../config.cfg, else built-in defaults. A file that opens but does
 *        not parse is an error.
 */
bool resolveConfig(const std::string* explicitPath, Config& cfg, std::string& err) {
    if (explicitPath) {
        return parseConfigFile(*explicitPath, cfg, err);
    }
    std::string loadedPath;
    return loadConfig({"config.cfg", "../config.cfg"}, cfg, loadedPath, err);
}

/** @brief Write the summary file if configured; false only on a write failure. */
bool finish(const Clinic& clinic, const Config& cfg) {
    if (cfg.summaryPath.empty()) {
        return true;
    }
    if (!writeSummary(clinic, cfg.summaryPath)) {
        return false;
    }
    std::cout << "Summary saved: " << cfg.summaryPath << std::endl;
    return true;
}
} // namespace

// Entry point dispatches run modes (demo, script, simulation, log summary) over one Clinic instance.
int main(int argc, char* argv[]) {
    int argi = 1;
    std::string configPath;
    bool haveConfigPath = false;
    if (argc >= 2 && std::string(argv[1]) == "--config") {
        if (argc < 3) {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
        configPath = argv[2];
        haveConfigPath = true;
        argi = 3;
    }
    if (argi >= argc) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    std::string mode = argv[argi];

    if (mode == "log-summary") {
        if (argi + 1 >= argc) {
            std::cerr << "Log summary usage: " << argv[0] << " log-summary <logPath>" << std::endl;
            return EXIT_FAILURE;
        }
        LogSummary summary;
        if (!summarizeLog(argv[argi + 1], summary)) {
            return EXIT_FAILURE;
        }
        for (const auto& kv : summary.roleCounts) {
            std::cout << kv.first << ": " << kv.second << "\n";
        }
        for (const auto& kv : summary.servedPerDoctor) {
            std::cout << "served by doctor " << kv.first << ": " << kv.second << "\n";
        }
        if (summary.malformed > 0) {
            std::cout << "malformed: " << summary.malformed << "\n";
        }
        return EXIT_SUCCESS;
    }

    Config cfg{};
    std::string err;
    if (!resolveConfig(haveConfigPath ? &configPath : nullptr, cfg, err)) {
        std::cerr << "Config error: " << err << std::endl;
        return EXIT_FAILURE;
    }

    Clinic clinic(cfg);
    Logger logger;
    if (!cfg.logPath.empty()) {
        if (!logger.openFile(cfg.logPath)) {
            die("cannot continue without log file " + cfg.logPath);
        }
        clinic.attachLogger(&logger);
    }
    clinic.note(Role::Driver, "Mode " + mode + " started");

    int rc = EXIT_SUCCESS;
    if (mode == "demo") {
        runDemo(clinic, std::cout);
    } else if (mode == "run") {
        if (argi + 1 >= argc) {
            std::cerr << "Run usage: " << argv[0] << " run <scriptPath|->" << std::endl;
            return EXIT_FAILURE;
        }
        std::string scriptPath = argv[argi + 1];
        ScriptResult result;
        if (scriptPath == "-") {
            result = runScript(clinic, std::cin, std::cout, std::cerr);
        } else {
            std::ifstream script(scriptPath);
            if (!script) {
                logErrno("cannot open script " + scriptPath);
                return EXIT_FAILURE;
            }
            result = runScript(clinic, script, std::cout, std::cerr);
        }
        std::cout << "Executed " << result.executed << " commands, " << result.failed << " rejected" << std::endl;
        if (result.failed > 0) {
            rc = EXIT_FAILURE;
        }
    } else if (mode == "simulate") {
        runSimulation(clinic, cfg, std::cout);
        if (!writeSummaryText(clinic, std::cout)) {
            rc = EXIT_FAILURE;
        }
    } else {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    clinic.note(Role::Driver, "Mode " + mode + " finished");
    if (!finish(clinic, cfg)) {
        rc = EXIT_FAILURE;
    }
    logger.closeFile();
    return rc;
}
