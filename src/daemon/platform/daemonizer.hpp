#pragma once

namespace platform {

// Detaches from the controlling terminal. Only the grandchild returns.
void daemonize();

} // namespace platform
