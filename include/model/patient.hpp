#pragma once

#include "types.hpp"

#include <string>
#include <vector>

struct Patient {
    int         id{0};
    std::string name;
    int         age{0};
    int         severity{0};           // hint only, triage severity is given per visit
    std::vector<std::string> history;  // caller-supplied notes, replaced on upsert
};

struct Doctor {
    int         id{0};
    std::string name;
    std::string specialization;
};

struct Slot {
    int         id{0};
    std::string startTime;
    std::string endTime;
    SlotStatus  status{SlotStatus::Free};
};

struct Token {
    int       tokenId{-1};
    int       patientId{-1};
    int       doctorId{-1};      // -1 when unassigned
    int       slotId{-1};        // -1 for emergency tokens
    TokenType type{TokenType::Routine};
    long long timestampMs{0};    // wall clock at creation

    bool hasSlot() const { return slotId != -1; }
};
