#pragma once

/// Umbrella header for the mcphub peer-process library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "transport/stdio_transport.hpp"
#include "framing.hpp"
#include "session.hpp"
#include "process.hpp"
#include "types.hpp"
#include "package_catalog.hpp"
#include "worker_pool.hpp"
#include "supervisor.hpp"
