#include "queue/routine_queue.hpp"

RoutineQueue::RoutineQueue(std::size_t capacity)
    : slots(capacity), head(0), tail(0), count(0) {}

bool RoutineQueue::enqueue(const Token& token) {
    if (slots.empty() || count == slots.size()) {
        return false;
    }
    slots[tail] = token;
    tail = (tail + 1) % slots.size();
    ++count;
    return true;
}

bool RoutineQueue::dequeue(Token& out) {
    if (count == 0) {
        return false;
    }
    out = slots[head];
    slots[head] = Token{};
    head = (head + 1) % slots.size();
    --count;
    return true;
}

bool RoutineQueue::peek(Token& out) const {
    if (count == 0) {
        return false;
    }
    out = slots[head];
    return true;
}

bool RoutineQueue::removeById(int tokenId, Token* removed) {
    bool found = false;
    std::vector<Token> keep;
    keep.reserve(count);
    std::size_t n = count;
    for (std::size_t i = 0; i < n; ++i) {
        Token t;
        dequeue(t);
        if (!found && t.tokenId == tokenId) {
            found = true;
            if (removed) *removed = t;
            continue;
        }
        keep.push_back(t);
    }
    for (const Token& t : keep) {
        enqueue(t);
    }
    return found;
}

bool RoutineQueue::pushFront(const Token& token) {
    if (slots.empty() || count == slots.size()) {
        return false;
    }
    std::vector<Token> rest;
    rest.reserve(count);
    Token t;
    while (dequeue(t)) {
        rest.push_back(t);
    }
    enqueue(token);
    for (const Token& r : rest) {
        enqueue(r);
    }
    return true;
}

bool RoutineQueue::contains(int tokenId) const {
    for (std::size_t i = 0; i < count; ++i) {
        if (slots[(head + i) % slots.size()].tokenId == tokenId) return true;
    }
    return false;
}

std::vector<Token> RoutineQueue::snapshot() const {
    std::vector<Token> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(slots[(head + i) % slots.size()]);
    }
    return out;
}
