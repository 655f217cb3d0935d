#pragma once

#include <string>

/**
 * @brief Print message to stderr and terminate with EXIT_FAILURE.
 */
void die(const std::string& message);

/**
 * @brief Print message followed by the current errno description to stderr.
 */
void logErrno(const std::string& message);

/**
 * @brief Print a non-errno diagnostic to stderr with the tool prefix.
 */
void logError(const std::string& message);
