#pragma once

#include "model/patient.hpp"

#include <cstddef>
#include <unordered_map>

/**
 * @brief Patient records keyed by id.
 */
class PatientIndex {
public:
    /**
     * @brief Insert or replace the whole record.
     * @return reference to the stored record.
     */
    const Patient& upsert(const Patient& patient);

    /** @brief Null when the id is unknown. */
    const Patient* get(int patientId) const;

    /** @return true when a record was erased. */
    bool remove(int patientId);

    std::size_t size() const { return table.size(); }

private:
    std::unordered_map<int, Patient> table;
};
