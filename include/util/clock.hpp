#pragma once

/** @brief Wall clock in milliseconds since the epoch (best effort, 0 on failure). */
long long wallClockMs();
