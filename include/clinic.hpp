#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "logging/logger.hpp"
#include "model/config.hpp"
#include "model/events.hpp"
#include "model/patient.hpp"
#include "model/types.hpp"
#include "queue/routine_queue.hpp"
#include "registry/patient_index.hpp"
#include "schedule/doctor_schedule.hpp"
#include "triage/triage_heap.hpp"
#include "undo/undo_log.hpp"

/**
 * @brief Central orchestrator: owns the routine queue, triage heap, slot
 *        ledgers, undo log and registries, and keeps them consistent.
 *
 * Every successful mutating call pushes exactly one undo record. The class is
 * not thread-safe; a concurrent host must serialize all calls behind a single
 * lock since each operation touches several structures.
 */
class Clinic {
public:
    /**
     * @param queueCapacity routine queue capacity (> 0).
     * @param firstTokenId id handed to the first token; later ids increase by
     *        one until INT_MAX has been issued, after which token creation
     *        reports Exhausted.
     */
    explicit Clinic(std::size_t queueCapacity = 500, int firstTokenId = 1000);

    /** @brief Build from validated configuration values. */
    explicit Clinic(const Config& config);

    /**
     * @brief Route event lines to logger (not owned, may be null to detach).
     */
    void attachLogger(Logger* logger);

    /** @brief Insert or replace a patient record. */
    const Patient& registerPatient(int id, const std::string& name, int age, int severity = 0);

    const Patient* findPatient(int id) const;

    /** @return Ok, or Duplicate when the id is already taken. */
    ClinicStatus addDoctor(int id, const std::string& name, const std::string& specialization);

    const Doctor* findDoctor(int id) const;

    /** @brief Slot ledger for a doctor, null when unknown. */
    const DoctorSchedule* findSchedule(int doctorId) const;

    /** @return Ok, NotFound (unknown doctor) or Duplicate (slot id taken). */
    ClinicStatus addSlotToDoctor(int doctorId, int slotId, const std::string& start, const std::string& end);

    /**
     * @brief Book the doctor's next free slot and queue a routine token.
     * @param out receives the new token on Ok.
     * @return NotFound (patient or doctor), NoCapacity (no free slot),
     *         QueueFull (slot booking rolled back), Exhausted (no token id
     *         left) or Ok.
     */
    ClinicStatus bookRoutine(int patientId, int doctorId, Token& out);

    /**
     * @brief Drop a queued routine token and free its slot.
     * @return false when the token is not in the routine queue.
     */
    bool cancelBooking(int tokenId);

    /**
     * @brief Queue an emergency token; lower severity is served first.
     * @param out receives the new token on Ok.
     * @return Ok, or Exhausted (nothing queued) when no token id is left.
     */
    ClinicStatus triageInsert(int patientId, int severity, Token& out, int doctorId = -1);

    /**
     * @brief Serve the most urgent emergency, else the oldest routine token.
     * @return Ok, or Empty when nobody is waiting.
     */
    ClinicStatus serveNext(Token& out);

    /**
     * @brief Invert the most recent recorded action.
     * @param description human-readable outcome ("Nothing to undo" when empty).
     * @return Ok, Empty, or the failure that kept the inverse from applying.
     */
    ClinicStatus undoLast(std::string& description);

    const RoutineQueue& routineQueue() const { return routine_; }
    const TriageHeap& triage() const { return triage_; }
    const UndoLog& undoLog() const { return undo_; }
    const std::vector<Token>& served() const { return served_; }
    const std::map<int, DoctorSchedule>& schedules() const { return schedules_; }
    const PatientIndex& patients() const { return patients_; }

    /**
     * @brief One line per served visit of the patient, oldest first, read
     *        from the served list ("token=<id> type=<type> doctor=<id>").
     */
    std::vector<std::string> visitHistory(int patientId) const;

    /** @brief Current load figures (also prefixed to every log line). */
    LogMetrics metrics() const;

    /** @brief Append a driver/report event to the attached log. */
    void note(Role role, const std::string& text);

private:
    ClinicStatus undoBook(const UndoRecord& record, std::string& description);
    ClinicStatus undoCancel(const UndoRecord& record, std::string& description);
    ClinicStatus undoServeRoutine(const UndoRecord& record, std::string& description);
    ClinicStatus undoServeTriage(const UndoRecord& record, std::string& description);
    ClinicStatus undoTriageInsert(const UndoRecord& record, std::string& description);

    DoctorSchedule* mutableSchedule(int doctorId);
    bool removeServed(int tokenId);
    bool tokenIdsLeft() const;
    void log(Role role, const std::string& text);

    PatientIndex patients_;
    std::map<int, DoctorSchedule> schedules_;
    RoutineQueue routine_;
    TriageHeap triage_;
    UndoLog undo_;
    std::vector<Token> served_;
    long long nextTokenId_;
    Logger* logger_;
    long long logSeq_;
};
