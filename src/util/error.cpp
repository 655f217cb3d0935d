#include "util/error.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

void die(const std::string& message) {
    std::cerr << "clinic: " << message << std::endl;
    std::exit(EXIT_FAILURE);
}

void logErrno(const std::string& message) {
    int saved = errno;
    if (!message.empty()) {
        std::cerr << "clinic: " << message << ": " << std::strerror(saved) << std::endl;
    } else {
        std::cerr << "clinic: " << std::strerror(saved) << std::endl;
    }
}

void logError(const std::string& message) {
    std::cerr << "clinic: " << message << std::endl;
}
