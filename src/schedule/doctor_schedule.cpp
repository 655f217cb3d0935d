#include "schedule/doctor_schedule.hpp"

DoctorSchedule::DoctorSchedule(const Doctor& doctor) : owner(doctor) {}

bool DoctorSchedule::addSlot(int slotId, const std::string& startTime, const std::string& endTime) {
    if (slotIndex.count(slotId) != 0) {
        return false;
    }
    Slot slot;
    slot.id = slotId;
    slot.startTime = startTime;
    slot.endTime = endTime;
    slot.status = SlotStatus::Free;
    slotIndex[slotId] = ledger.size();
    ledger.push_back(slot);
    return true;
}

bool DoctorSchedule::bookNextFree(Slot& out) {
    for (auto it = ledger.rbegin(); it != ledger.rend(); ++it) {
        if (it->status == SlotStatus::Free) {
            it->status = SlotStatus::Booked;
            out = *it;
            return true;
        }
    }
    return false;
}

bool DoctorSchedule::cancelSlot(int slotId) {
    Slot* slot = mutableSlot(slotId);
    if (!slot || slot->status != SlotStatus::Booked) {
        return false;
    }
    slot->status = SlotStatus::Free;
    return true;
}

bool DoctorSchedule::rebookSlot(int slotId) {
    Slot* slot = mutableSlot(slotId);
    if (!slot || slot->status != SlotStatus::Free) {
        return false;
    }
    slot->status = SlotStatus::Booked;
    return true;
}

const Slot* DoctorSchedule::findSlot(int slotId) const {
    auto it = slotIndex.find(slotId);
    if (it == slotIndex.end()) return nullptr;
    return &ledger[it->second];
}

int DoctorSchedule::pendingCount() const {
    int booked = 0;
    for (const Slot& s : ledger) {
        if (s.status == SlotStatus::Booked) ++booked;
    }
    return booked;
}

const Slot* DoctorSchedule::nextFreeSlot() const {
    for (auto it = ledger.rbegin(); it != ledger.rend(); ++it) {
        if (it->status == SlotStatus::Free) return &*it;
    }
    return nullptr;
}

Slot* DoctorSchedule::mutableSlot(int slotId) {
    auto it = slotIndex.find(slotId);
    if (it == slotIndex.end()) return nullptr;
    return &ledger[it->second];
}
