#pragma once

#include <cstddef>
#include <random>

/**
 * @brief Wrapper around std::mt19937 for reproducible workloads.
 */
class RandomGenerator {
public:
    /** @brief Seed with std::random_device for non-deterministic runs. */
    RandomGenerator();

    /** @brief Seed with a fixed value for deterministic runs. */
    explicit RandomGenerator(unsigned int seed);

    /**
     * @brief Inclusive integer range [min, max].
     */
    int uniformInt(int min, int max);

    /** @brief True with the given probability in percent (0..100). */
    bool chance(int percent);

    /** @brief Uniform index in [0, count); count must be > 0. */
    std::size_t pickIndex(std::size_t count);

private:
    std::mt19937 engine;
};
