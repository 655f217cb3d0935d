#include "util/random.hpp"

RandomGenerator::RandomGenerator() : engine(std::random_device{}()) {}

RandomGenerator::RandomGenerator(unsigned int seed) : engine(seed) {}

int RandomGenerator::uniformInt(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(engine);
}

bool RandomGenerator::chance(int percent) {
    if (percent <= 0) return false;
    if (percent >= 100) return true;
    return uniformInt(0, 99) < percent;
}

std::size_t RandomGenerator::pickIndex(std::size_t count) {
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(engine);
}
