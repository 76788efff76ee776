#pragma once

#include <expected>
#include <string>

namespace platform {

// Detaches from the terminal. Returns only in the detached child; the original
// process exits with status 0 once the first fork succeeds.
std::expected<void, std::string> daemonize();

} // namespace platform
