#include "util/clock.hpp"

#include <ctime>

long long wallClockMs() {
    struct timespec ts {};
    if (clock_gettime(CLOCK_REALTIME, &ts) == -1) return 0;
    return static_cast<long long>(ts.tv_sec) * 1000LL + ts.tv_nsec / 1000000LL;
}
