#include "report/report.hpp"

#include "clinic.hpp"
#include "util/error.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_map>

std::vector<DoctorReport> reportPerDoctor(const Clinic& clinic) {
    std::vector<DoctorReport> rows;
    for (const auto& kv : clinic.schedules()) {
        const DoctorSchedule& sched = kv.second;
        DoctorReport row;
        row.doctorId = kv.first;
        row.doctorName = sched.doctor().name;
        row.pendingBookedSlots = sched.pendingCount();
        const Slot* next = sched.nextFreeSlot();
        row.nextFreeSlotId = next ? next->id : -1;
        rows.push_back(row);
    }
    return rows;
}

ServedPendingReport reportServedVsPending(const Clinic& clinic) {
    ServedPendingReport rep;
    rep.served = static_cast<int>(clinic.served().size());
    rep.pending = static_cast<int>(clinic.routineQueue().size() + clinic.triage().size());
    return rep;
}

std::vector<PatientFrequency> topKFrequentPatients(const Clinic& clinic, int k) {
    std::vector<PatientFrequency> counts;
    std::unordered_map<int, size_t> position;
    for (const Token& t : clinic.served()) {
        auto it = position.find(t.patientId);
        if (it == position.end()) {
            position[t.patientId] = counts.size();
            counts.emplace_back(t.patientId, 1);
        } else {
            counts[it->second].second += 1;
        }
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const PatientFrequency& a, const PatientFrequency& b) { return a.second > b.second; });
    if (k <= 0) {
        counts.clear();
    } else if (counts.size() > static_cast<size_t>(k)) {
        counts.resize(static_cast<size_t>(k));
    }
    return counts;
}

bool writeSummaryText(const Clinic& clinic, std::ostream& out, int topK) {
    ServedPendingReport totals = reportServedVsPending(clinic);
    out << "Clinic Summary\n";
    out << "==============\n";
    out << "Served:  " << totals.served << "\n";
    out << "Pending: " << totals.pending << " (routine " << clinic.routineQueue().size()
        << ", triage " << clinic.triage().size() << ")\n";
    out << "Undo depth: " << clinic.undoLog().size() << "\n";
    out << "Doctors:\n";
    std::vector<DoctorReport> rows = reportPerDoctor(clinic);
    if (rows.empty()) {
        out << "  none\n";
    }
    for (const DoctorReport& row : rows) {
        out << "  " << row.doctorId << " " << row.doctorName
            << ": booked=" << row.pendingBookedSlots << " next free=";
        if (row.nextFreeSlotId != -1) {
            out << row.nextFreeSlotId << "\n";
        } else {
            out << "none\n";
        }
        const DoctorSchedule* sched = clinic.findSchedule(row.doctorId);
        if (!sched) continue;
        for (const Slot& slot : sched->slots()) {
            out << "    slot " << slot.id << " " << slot.startTime << "-" << slot.endTime
                << " " << slotStatusName(slot.status) << "\n";
        }
    }
    out << "Top " << topK << " patients:\n";
    std::vector<PatientFrequency> top = topKFrequentPatients(clinic, topK);
    if (top.empty()) {
        out << "  none served\n";
    }
    for (const PatientFrequency& pf : top) {
        out << "  patient " << pf.first << ": " << pf.second << "\n";
    }
    return static_cast<bool>(out);
}

bool writeSummary(const Clinic& clinic, const std::string& path, int topK) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        logErrno("summary file open failed: " + path);
        return false;
    }
    return writeSummaryText(clinic, out, topK);
}
