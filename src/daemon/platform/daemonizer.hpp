#pragma once

namespace platform {

// Double-fork into the background with stdio redirected to /dev/null.
void daemonize();

} // namespace platform
