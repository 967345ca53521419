#include <toolhost/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace toolhost {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace toolhost
