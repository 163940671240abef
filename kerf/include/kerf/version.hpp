#pragma once

#define KERF_VERSION "1.6.0"
#define KERF_PROTOCOL_VERSION "2024-11-05"
#define KERF_SERVER_NAME "kerf"

namespace kerf {
namespace version {

// Default JSON-RPC version echoed when a request omits "jsonrpc"
inline const char* jsonrpc() { return "2.0"; }

} // namespace version
} // namespace kerf
