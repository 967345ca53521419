#pragma once

namespace toolhost {

/// Returns true if stderr is a terminal (colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace toolhost
