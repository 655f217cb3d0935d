#include "undo/undo_log.hpp"

void UndoLog::push(const UndoRecord& record) {
    records.push_back(record);
}

bool UndoLog::pop(UndoRecord& out) {
    if (records.empty()) {
        return false;
    }
    out = records.back();
    records.pop_back();
    return true;
}

bool UndoLog::peek(UndoRecord& out) const {
    if (records.empty()) {
        return false;
    }
    out = records.back();
    return true;
}
