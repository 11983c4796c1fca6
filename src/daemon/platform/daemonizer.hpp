#pragma once

namespace platform {

// Detach from the terminal; stdio is redirected to /dev/null.
void daemonize();

} // namespace platform
