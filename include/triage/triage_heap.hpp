#pragma once

#include "model/patient.hpp"

#include <cstddef>
#include <vector>

struct TriageEntry {
    int       severity{0};    // lower is more urgent
    long long sequence{0};    // insertion order, breaks severity ties
    Token     token;
};

/**
 * @brief Min-heap of emergency tokens keyed by (severity, sequence).
 */
class TriageHeap {
public:
    TriageHeap();

    /**
     * @brief Insert with the next sequence number, O(log n).
     * @return the stored entry (severity and assigned sequence).
     */
    TriageEntry insert(const Token& token, int severity);

    /**
     * @brief Put back an entry taken out by extractMin, keeping its sequence.
     */
    void restore(const TriageEntry& entry);

    /** @brief Remove the most urgent entry; false when empty. */
    bool extractMin(TriageEntry& out);

    /** @brief Most urgent entry without removing it; false when empty. */
    bool peek(TriageEntry& out) const;

    /**
     * @brief Pop every entry, keep the others and re-heapify, O(n log n).
     * @return true when an entry with tokenId was dropped.
     */
    bool removeById(int tokenId);

    /** @brief Entries in service order. */
    std::vector<TriageEntry> snapshot() const;

    bool empty() const { return heap.empty(); }
    std::size_t size() const { return heap.size(); }

private:
    std::vector<TriageEntry> heap;
    long long nextSequence;
};
