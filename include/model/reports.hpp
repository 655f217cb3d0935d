#pragma once

#include <string>
#include <utility>
#include <vector>

struct DoctorReport {
    int doctorId{0};
    std::string doctorName;
    int pendingBookedSlots{0};
    int nextFreeSlotId{-1};    // -1 when every slot is booked
};

struct ServedPendingReport {
    int served{0};
    int pending{0};
};

// (patientId, servedCount)
using PatientFrequency = std::pair<int, int>;
