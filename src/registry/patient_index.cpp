#include "registry/patient_index.hpp"

const Patient& PatientIndex::upsert(const Patient& patient) {
    Patient& stored = table[patient.id];
    stored = patient;
    return stored;
}

const Patient* PatientIndex::get(int patientId) const {
    auto it = table.find(patientId);
    return it == table.end() ? nullptr : &it->second;
}

bool PatientIndex::remove(int patientId) {
    return table.erase(patientId) != 0;
}
