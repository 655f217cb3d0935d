#include "cli/command_script.hpp"

#include "clinic.hpp"
#include "logging/log_parser.hpp"
#include "report/report.hpp"

#include <sstream>
#include <vector>

namespace {
bool parseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string tokenText(const Token& t) {
    std::string text = "token=" + std::to_string(t.tokenId) + " patient=" + std::to_string(t.patientId) +
                       " doctor=" + std::to_string(t.doctorId);
    if (t.hasSlot()) {
        text += " slot=" + std::to_string(t.slotId);
    }
    return text;
}

/** @brief Parse args[first..] as ints; false on count mismatch or bad number. */
bool intArgs(const std::vector<std::string>& args, size_t first, size_t required, size_t optional,
             std::vector<int>& values, std::string& err) {
    size_t given = args.size() - first;
    if (given < required || given > required + optional) {
        err = "wrong number of arguments for '" + args[0] + "'";
        return false;
    }
    for (size_t i = first; i < args.size(); ++i) {
        int v = 0;
        if (!parseInt(args[i], v)) {
            err = "not a number: " + args[i];
            return false;
        }
        values.push_back(v);
    }
    return true;
}
} // namespace

bool executeCommand(Clinic& clinic, const std::string& line, std::ostream& out, std::string& err) {
    std::istringstream ss(line);
    std::vector<std::string> args;
    std::string word;
    while (ss >> word) {
        args.push_back(word);
    }
    if (args.empty()) {
        err = "empty command";
        return false;
    }
    const std::string& cmd = args[0];
    std::vector<int> v;

    if (cmd == "patient") {
        if (args.size() < 4 || args.size() > 5) {
            err = "usage: patient <id> <name> <age> [severity]";
            return false;
        }
        int id = 0, age = 0, severity = 0;
        if (!parseInt(args[1], id) || !parseInt(args[3], age) ||
            (args.size() == 5 && !parseInt(args[4], severity))) {
            err = "usage: patient <id> <name> <age> [severity]";
            return false;
        }
        clinic.registerPatient(id, args[2], age, severity);
        out << "Registered patient " << id << " " << args[2] << "\n";
        return true;
    }
    if (cmd == "doctor") {
        int id = 0;
        if (args.size() != 4 || !parseInt(args[1], id)) {
            err = "usage: doctor <id> <name> <specialization>";
            return false;
        }
        ClinicStatus st = clinic.addDoctor(id, args[2], args[3]);
        out << "Doctor " << id << ": " << statusName(st) << "\n";
        return true;
    }
    if (cmd == "slot") {
        int doctorId = 0, slotId = 0;
        if (args.size() != 5 || !parseInt(args[1], doctorId) || !parseInt(args[2], slotId)) {
            err = "usage: slot <doctorId> <slotId> <start> <end>";
            return false;
        }
        ClinicStatus st = clinic.addSlotToDoctor(doctorId, slotId, args[3], args[4]);
        out << "Slot " << slotId << ": " << statusName(st) << "\n";
        return true;
    }
    if (cmd == "book") {
        if (!intArgs(args, 1, 2, 0, v, err)) return false;
        Token t;
        ClinicStatus st = clinic.bookRoutine(v[0], v[1], t);
        if (st == ClinicStatus::Ok) {
            out << "Booked " << tokenText(t) << "\n";
        } else {
            out << "Booking failed: " << statusName(st) << "\n";
        }
        return true;
    }
    if (cmd == "cancel") {
        if (!intArgs(args, 1, 1, 0, v, err)) return false;
        if (clinic.cancelBooking(v[0])) {
            out << "Cancelled token " << v[0] << "\n";
        } else {
            out << "Token " << v[0] << " is not queued\n";
        }
        return true;
    }
    if (cmd == "triage") {
        if (!intArgs(args, 1, 2, 1, v, err)) return false;
        Token t;
        ClinicStatus st = clinic.triageInsert(v[0], v[1], t, v.size() == 3 ? v[2] : -1);
        if (st == ClinicStatus::Ok) {
            out << "Triage " << tokenText(t) << " severity=" << v[1] << "\n";
        } else {
            out << "Triage failed: " << statusName(st) << "\n";
        }
        return true;
    }
    if (cmd == "serve") {
        if (!intArgs(args, 1, 0, 0, v, err)) return false;
        Token t;
        if (clinic.serveNext(t) == ClinicStatus::Ok) {
            out << "Served " << tokenTypeName(t.type) << " " << tokenText(t) << "\n";
        } else {
            out << "Nothing to serve\n";
        }
        return true;
    }
    if (cmd == "undo") {
        if (!intArgs(args, 1, 0, 0, v, err)) return false;
        std::string description;
        ClinicStatus st = clinic.undoLast(description);
        out << description;
        if (st != ClinicStatus::Ok && st != ClinicStatus::Empty) {
            out << " (" << statusName(st) << ")";
        }
        out << "\n";
        return true;
    }
    if (cmd == "report") {
        if (!intArgs(args, 1, 0, 0, v, err)) return false;
        clinic.note(Role::Report, "Report requested");
        if (!writeSummaryText(clinic, out)) {
            err = "summary output failed";
            return false;
        }
        return true;
    }
    if (cmd == "history") {
        if (!intArgs(args, 1, 1, 0, v, err)) return false;
        std::vector<std::string> visits = clinic.visitHistory(v[0]);
        if (visits.empty()) {
            out << "patient " << v[0] << ": no visits\n";
        }
        for (const std::string& visit : visits) {
            out << "patient " << v[0] << ": " << visit << "\n";
        }
        return true;
    }
    if (cmd == "top") {
        if (!intArgs(args, 1, 1, 0, v, err)) return false;
        for (const PatientFrequency& pf : topKFrequentPatients(clinic, v[0])) {
            out << "patient " << pf.first << ": " << pf.second << "\n";
        }
        return true;
    }
    err = "unknown command: " + cmd;
    return false;
}

ScriptResult runScript(Clinic& clinic, std::istream& in, std::ostream& out, std::ostream& errOut) {
    ScriptResult result;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        std::string err;
        if (executeCommand(clinic, line, out, err)) {
            ++result.executed;
        } else {
            ++result.failed;
            errOut << "line " << lineNo << ": " << err << "\n";
            clinic.note(Role::Driver, "Script error line=" + std::to_string(lineNo) + " " + err);
        }
    }
    return result;
}
