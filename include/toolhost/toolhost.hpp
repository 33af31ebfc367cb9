#pragma once

/// Umbrella header for the toolhost library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "schema.hpp"
#include "registry.hpp"
#include "worker_pool.hpp"
#include "dispatcher.hpp"
#include "frame_reader.hpp"
#include "protocol_handler.hpp"
#include "session.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "http_fetch.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
