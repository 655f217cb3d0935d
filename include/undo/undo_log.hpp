#pragma once

#include "model/events.hpp"

#include <cstddef>
#include <vector>

/**
 * @brief LIFO stack of undo records; push/pop are O(1).
 */
class UndoLog {
public:
    UndoLog() = default;

    void push(const UndoRecord& record);

    /** @brief Remove the newest record; false when the log is empty. */
    bool pop(UndoRecord& out);

    /** @brief Newest record without removing it; false when empty. */
    bool peek(UndoRecord& out) const;

    bool empty() const { return records.empty(); }
    std::size_t size() const { return records.size(); }

private:
    std::vector<UndoRecord> records;
};
