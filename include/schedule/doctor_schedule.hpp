#pragma once

#include "model/patient.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

/**
 * @brief Slot ledger for one doctor.
 *
 * Slots are kept in insertion order with a hash index by slot id. The search
 * for a free slot walks from the most recently added slot backwards, so a
 * newly opened slot is offered first.
 */
class DoctorSchedule {
public:
    explicit DoctorSchedule(const Doctor& doctor);

    /**
     * @brief Add a FREE slot.
     * @return false (no mutation) if the slot id already exists for this doctor.
     */
    bool addSlot(int slotId, const std::string& startTime, const std::string& endTime);

    /**
     * @brief Book the first FREE slot in search order.
     * @param out receives a copy of the booked slot.
     * @return false when every slot is booked.
     */
    bool bookNextFree(Slot& out);

    /** @brief BOOKED -> FREE; false if missing or already FREE. */
    bool cancelSlot(int slotId);

    /** @brief FREE -> BOOKED for a specific slot; false if missing or already BOOKED. */
    bool rebookSlot(int slotId);

    /** @brief O(1) lookup; null when the id is unknown. */
    const Slot* findSlot(int slotId) const;

    /** @brief Number of BOOKED slots. */
    int pendingCount() const;

    /** @brief First FREE slot in search order without booking it; null if none. */
    const Slot* nextFreeSlot() const;

    const Doctor& doctor() const { return owner; }
    std::size_t slotCount() const { return ledger.size(); }

    /** @brief Slots in insertion order. */
    const std::vector<Slot>& slots() const { return ledger; }

private:
    Slot* mutableSlot(int slotId);

    Doctor owner;
    std::vector<Slot> ledger;
    std::unordered_map<int, std::size_t> slotIndex;
};
