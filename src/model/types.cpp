#include "model/types.hpp"

std::string statusName(ClinicStatus status) {
    switch (status) {
        case ClinicStatus::Ok: return "OK";
        case ClinicStatus::NotFound: return "NOT_FOUND";
        case ClinicStatus::NoCapacity: return "NO_CAPACITY";
        case ClinicStatus::QueueFull: return "QUEUE_FULL";
        case ClinicStatus::Empty: return "EMPTY";
        case ClinicStatus::Duplicate: return "DUPLICATE";
        case ClinicStatus::Exhausted: return "EXHAUSTED";
        case ClinicStatus::InvalidAction: return "INVALID_ACTION";
        default: return "UNKNOWN";
    }
}

std::string tokenTypeName(TokenType type) {
    return type == TokenType::Emergency ? "EMERGENCY" : "ROUTINE";
}

std::string slotStatusName(SlotStatus status) {
    return status == SlotStatus::Booked ? "BOOKED" : "FREE";
}

std::string undoKindName(UndoKind kind) {
    switch (kind) {
        case UndoKind::Book: return "BOOK";
        case UndoKind::Cancel: return "CANCEL";
        case UndoKind::ServeRoutine: return "SERVE_ROUTINE";
        case UndoKind::ServeTriage: return "SERVE_TRIAGE";
        case UndoKind::TriageInsert: return "TRIAGE_INSERT";
        default: return "UNKNOWN";
    }
}

std::string roleLabel(Role role) {
    switch (role) {
        case Role::Registry: return "registry";
        case Role::Booking: return "booking";
        case Role::Triage: return "triage";
        case Role::Service: return "service";
        case Role::Undo: return "undo";
        case Role::Report: return "report";
        case Role::Driver: return "driver";
        default: return "unknown";
    }
}
