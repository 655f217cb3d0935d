#include "triage/triage_heap.hpp"

#include <algorithm>

namespace {
/** @brief Heap comparator: "a is served after b", so the front is the minimum. */
bool servedLater(const TriageEntry& a, const TriageEntry& b) {
    if (a.severity != b.severity) return a.severity > b.severity;
    return a.sequence > b.sequence;
}
} // namespace

TriageHeap::TriageHeap() : nextSequence(0) {}

TriageEntry TriageHeap::insert(const Token& token, int severity) {
    TriageEntry entry;
    entry.severity = severity;
    entry.sequence = nextSequence++;
    entry.token = token;
    heap.push_back(entry);
    std::push_heap(heap.begin(), heap.end(), servedLater);
    return entry;
}

void TriageHeap::restore(const TriageEntry& entry) {
    heap.push_back(entry);
    std::push_heap(heap.begin(), heap.end(), servedLater);
    if (entry.sequence >= nextSequence) {
        nextSequence = entry.sequence + 1;
    }
}

bool TriageHeap::extractMin(TriageEntry& out) {
    if (heap.empty()) {
        return false;
    }
    std::pop_heap(heap.begin(), heap.end(), servedLater);
    out = heap.back();
    heap.pop_back();
    return true;
}

bool TriageHeap::peek(TriageEntry& out) const {
    if (heap.empty()) {
        return false;
    }
    out = heap.front();
    return true;
}

bool TriageHeap::removeById(int tokenId) {
    std::vector<TriageEntry> kept;
    kept.reserve(heap.size());
    bool removed = false;
    TriageEntry entry;
    while (extractMin(entry)) {
        if (entry.token.tokenId == tokenId) {
            removed = true;
            continue;
        }
        kept.push_back(entry);
    }
    heap.swap(kept);
    std::make_heap(heap.begin(), heap.end(), servedLater);
    return removed;
}

std::vector<TriageEntry> TriageHeap::snapshot() const {
    std::vector<TriageEntry> ordered(heap);
    std::sort(ordered.begin(), ordered.end(),
              [](const TriageEntry& a, const TriageEntry& b) { return servedLater(b, a); });
    return ordered;
}
