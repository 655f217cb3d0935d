#pragma once

#include <string>

enum class TokenType {
    Routine,
    Emergency
};

enum class SlotStatus {
    Free,
    Booked
};

enum class UndoKind {
    Book = 1,
    Cancel = 2,
    ServeRoutine = 3,
    ServeTriage = 4,
    TriageInsert = 5
};

/**
 * @brief Outcome of a clinic operation.
 *
 * NoCapacity and QueueFull are recoverable by retrying later; Exhausted means
 * no token id is left to hand out. InvalidAction marks an internal defect
 * (unknown undo record) rather than a caller error.
 */
enum class ClinicStatus {
    Ok,
    NotFound,
    NoCapacity,
    QueueFull,
    Empty,
    Duplicate,
    Exhausted,
    InvalidAction
};

enum class Role {
    Registry,
    Booking,
    Triage,
    Service,
    Undo,
    Report,
    Driver
};

/** @brief Stable upper-case label, e.g. "NOT_FOUND". */
std::string statusName(ClinicStatus status);

/** @brief "ROUTINE" or "EMERGENCY". */
std::string tokenTypeName(TokenType type);

/** @brief "FREE" or "BOOKED". */
std::string slotStatusName(SlotStatus status);

/** @brief Upper-case undo kind label, "UNKNOWN" for out-of-range values. */
std::string undoKindName(UndoKind kind);

/** @brief Lower-case role label used in log lines. */
std::string roleLabel(Role role);
