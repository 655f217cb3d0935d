#pragma once

#include "model/patient.hpp"

#include <cstddef>
#include <vector>

/**
 * @brief Fixed-capacity ring buffer of routine tokens in arrival order.
 *
 * enqueue/dequeue/peek are O(1). Removal by token id is not native: it drains
 * size() entries and re-enqueues the survivors, keeping their relative order.
 */
class RoutineQueue {
public:
    /** @brief Allocate the backing array; capacity must be > 0. */
    explicit RoutineQueue(std::size_t capacity);

    /**
     * @brief Append at the tail.
     * @return false (and no mutation) when the queue is full.
     */
    bool enqueue(const Token& token);

    /**
     * @brief Remove the oldest token.
     * @param out receives the token on success.
     * @return false when empty.
     */
    bool dequeue(Token& out);

    /** @brief Copy the oldest token without removing it; false when empty. */
    bool peek(Token& out) const;

    /**
     * @brief Drain and rebuild, dropping the token with the given id.
     * @param removed receives the dropped token when found (may be null).
     * @return true when a token was removed.
     */
    bool removeById(int tokenId, Token* removed = nullptr);

    /**
     * @brief Insert at the head by rebuilding behind it.
     * @return false (and no mutation) when the queue is full.
     */
    bool pushFront(const Token& token);

    /** @brief True when a token with this id is queued. */
    bool contains(int tokenId) const;

    /** @brief Tokens head to tail. */
    std::vector<Token> snapshot() const;

    bool empty() const { return count == 0; }
    bool full() const { return count == slots.size(); }
    std::size_t size() const { return count; }
    std::size_t capacity() const { return slots.size(); }

private:
    std::vector<Token> slots;
    std::size_t head;
    std::size_t tail;
    std::size_t count;
};
