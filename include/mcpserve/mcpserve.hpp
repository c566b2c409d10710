#pragma once

/// Umbrella header for the mcpserve library.

#include "version.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "base64.hpp"
#include "framing.hpp"
#include "capability.hpp"
#include "session.hpp"
#include "router.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/auth_gate.hpp"
#include "transport/http_transport.hpp"
