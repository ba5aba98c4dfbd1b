#pragma once

#include "opsgate/config.h"

namespace opsgate {

// Bind, accept and serve until SIGINT/SIGTERM. Returns the process exit code.
int cmd_serve(const GatewayConfig& cfg);

} // namespace opsgate
