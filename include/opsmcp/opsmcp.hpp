#pragma once

/// Umbrella header for the opsmcp DevOps MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "router.hpp"
#include "dispatcher.hpp"
#include "config.hpp"
#include "server.hpp"
#include "transport/http_transport.hpp"
#include "tools/devops_capabilities.hpp"
