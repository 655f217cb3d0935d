#pragma once

#include <map>
#include <ostream>
#include <string>

#include "model/config.hpp"

class Clinic;

/**
 * @brief Sample run: two doctors, four slots, three patients, two bookings,
 *        one emergency, two serves, reports and one undo.
 */
void runDemo(Clinic& clinic, std::ostream& out);

/**
 * @brief Seeded random workload mixing bookings, cancellations, emergencies,
 *        serves and undos; sizes and seed come from cfg.
 * @return number of operations attempted.
 */
int runSimulation(Clinic& clinic, const Config& cfg, std::ostream& out);

struct LogSummary {
    std::map<std::string, int> roleCounts;       // role label -> line count
    std::map<int, int> servedPerDoctor;          // doctor id (-1 unassigned) -> serve events
    int malformed{0};
};

/**
 * @brief Count log lines per role and serve events per doctor.
 * @return false if the file cannot be opened.
 */
bool summarizeLog(const std::string& path, LogSummary& summary);
