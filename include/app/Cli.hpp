#pragma once

#include <string>
#include <vector>

namespace binview::app {

// Entry point behind main(): args excludes the program name. Returns the
// process exit status; fatal errors print one "binview: <message>" line.
[[nodiscard]] int run_cli(const std::vector<std::string>& args);

} // namespace binview::app
