#include "core/Console.hpp"

#include <iostream>
#include <iterator>

#include <unistd.h>

namespace czcheck {

bool ConsoleInput::isInteractive() const {
    return ::isatty(STDIN_FILENO) != 0;
}

std::string ConsoleInput::readAll() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void ConsoleOutput::success(const std::string& message) {
    if (::isatty(STDOUT_FILENO)) {
        std::cout << "\033[32m" << message << "\033[0m\n";
    } else {
        std::cout << message << "\n";
    }
}

void ConsoleOutput::failure(const std::string& message) {
    if (::isatty(STDERR_FILENO)) {
        std::cerr << "\033[31m" << message << "\033[0m\n";
    } else {
        std::cerr << message << "\n";
    }
}

}
