#pragma once

/// Umbrella header for the mcpbridge library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "value_translator.hpp"
#include "backend.hpp"
#include "router.hpp"
#include "handlers.hpp"
#include "bridge.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/socket_backend.hpp"
