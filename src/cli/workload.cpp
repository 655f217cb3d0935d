#include "cli/workload.hpp"

#include "clinic.hpp"
#include "logging/log_parser.hpp"
#include "report/report.hpp"
#include "util/error.hpp"
#include "util/random.hpp"

#include <fstream>
#include <vector>

namespace {
void printToken(std::ostream& out, const std::string& label, const Token& t) {
    out << label << " token=" << t.tokenId << " patient=" << t.patientId
        << " doctor=" << t.doctorId << " type=" << tokenTypeName(t.type);
    if (t.hasSlot()) out << " slot=" << t.slotId;
    out << "\n";
}

void printTotals(std::ostream& out, const Clinic& clinic) {
    ServedPendingReport rep = reportServedVsPending(clinic);
    out << "Served vs pending: served=" << rep.served << " pending=" << rep.pending << "\n";
}
} // namespace

void runDemo(Clinic& clinic, std::ostream& out) {
    clinic.addDoctor(1, "Dr. Rao", "General");
    clinic.addDoctor(2, "Dr. Mehta", "Cardio");
    clinic.addSlotToDoctor(1, 101, "09:00", "09:15");
    clinic.addSlotToDoctor(1, 102, "09:15", "09:30");
    clinic.addSlotToDoctor(2, 201, "10:00", "10:15");
    clinic.addSlotToDoctor(2, 202, "10:15", "10:30");

    clinic.registerPatient(1, "Alice", 30);
    clinic.registerPatient(2, "Bob", 45);
    clinic.registerPatient(3, "Charlie", 25);

    Token t;
    for (int patientId : {1, 2}) {
        ClinicStatus st = clinic.bookRoutine(patientId, 1, t);
        if (st == ClinicStatus::Ok) {
            printToken(out, "Booked:", t);
        } else {
            out << "Booking for patient " << patientId << " failed: " << statusName(st) << "\n";
        }
    }

    ClinicStatus st = clinic.triageInsert(3, 2, t, 1);
    if (st == ClinicStatus::Ok) {
        printToken(out, "Triage inserted:", t);
    } else {
        out << "Triage for patient 3 failed: " << statusName(st) << "\n";
    }

    for (int i = 0; i < 2; ++i) {
        if (clinic.serveNext(t) == ClinicStatus::Ok) {
            printToken(out, "Served:", t);
        }
    }

    out << "Per-doctor report:\n";
    for (const DoctorReport& row : reportPerDoctor(clinic)) {
        out << "  doctor=" << row.doctorId << " name=" << row.doctorName
            << " booked=" << row.pendingBookedSlots << " nextFree=";
        if (row.nextFreeSlotId != -1) out << row.nextFreeSlotId;
        else out << "none";
        out << "\n";
    }
    printTotals(out, clinic);

    std::string description;
    clinic.undoLast(description);
    out << "Undo result: " << description << "\n";
    printTotals(out, clinic);
}

int runSimulation(Clinic& clinic, const Config& cfg, std::ostream& out) {
    RandomGenerator rng(cfg.randomSeed);
    const int patientBase = 1;
    const int doctorBase = 1;

    for (int d = 0; d < cfg.simulateDoctors; ++d) {
        int doctorId = doctorBase + d;
        clinic.addDoctor(doctorId, "Doctor" + std::to_string(doctorId), "General");
        for (int s = 0; s < cfg.simulateSlotsPerDoctor; ++s) {
            int slotId = doctorId * 100 + s + 1;
            int minute = s * 15;
            std::string start = std::to_string(9 + minute / 60) + ":" + (minute % 60 < 10 ? "0" : "") +
                                std::to_string(minute % 60);
            minute += 15;
            std::string end = std::to_string(9 + minute / 60) + ":" + (minute % 60 < 10 ? "0" : "") +
                              std::to_string(minute % 60);
            clinic.addSlotToDoctor(doctorId, slotId, start, end);
        }
    }
    for (int p = 0; p < cfg.simulatePatients; ++p) {
        clinic.registerPatient(patientBase + p, "Patient" + std::to_string(patientBase + p),
                               rng.uniformInt(1, 90));
    }

    std::vector<int> booked;
    int attempted = 0;
    int failures = 0;
    for (int step = 0; step < cfg.simulateSteps; ++step) {
        ++attempted;
        int roll = rng.uniformInt(0, 99);
        int patientId = patientBase + rng.uniformInt(0, cfg.simulatePatients - 1);
        if (roll < 40) {
            Token t;
            int doctorId = doctorBase + rng.uniformInt(0, cfg.simulateDoctors - 1);
            if (clinic.bookRoutine(patientId, doctorId, t) == ClinicStatus::Ok) {
                booked.push_back(t.tokenId);
            } else {
                ++failures;
            }
        } else if (roll < 50) {
            if (booked.empty() || !clinic.cancelBooking(booked[rng.pickIndex(booked.size())])) {
                ++failures;
            }
        } else if (roll < 65) {
            int doctorId = rng.chance(50) ? doctorBase + rng.uniformInt(0, cfg.simulateDoctors - 1) : -1;
            Token t;
            if (clinic.triageInsert(patientId, rng.uniformInt(0, 4), t, doctorId) != ClinicStatus::Ok) {
                ++failures;
            }
        } else if (roll < 92) {
            Token t;
            if (clinic.serveNext(t) != ClinicStatus::Ok) {
                ++failures;
            }
        } else {
            std::string description;
            if (clinic.undoLast(description) != ClinicStatus::Ok) {
                ++failures;
            }
        }
    }
    out << "Simulated " << attempted << " operations (" << failures << " without effect)\n";
    return attempted;
}

bool summarizeLog(const std::string& path, LogSummary& summary) {
    std::ifstream in(path);
    if (!in) {
        logErrno("cannot open log file: " + path);
        return false;
    }
    summary = LogSummary();
    std::string line;
    while (std::getline(in, line)) {
        if (trim(line).empty()) continue;
        LogEntry entry;
        if (!parseLogLine(line, entry)) {
            ++summary.malformed;
            continue;
        }
        summary.roleCounts[entry.role] += 1;
        int doctorId = 0;
        if (entry.text.rfind("Served ", 0) == 0 && extractInt(entry.text, "doctor=", doctorId)) {
            summary.servedPerDoctor[doctorId] += 1;
        }
    }
    return true;
}
