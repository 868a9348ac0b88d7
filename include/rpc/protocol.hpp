// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef COMMITLOG_RPC_PROTOCOL_HPP
#define COMMITLOG_RPC_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>

namespace commitlog {
namespace rpc {

/**
 * File server wire protocol
 *
 * One JSON object per line in each direction, strictly request/response
 * on a persistent TCP connection. File contents travel hex-encoded.
 *
 * Requests ("op" selects the operation):
 *   {"op":"exists", "path":P}
 *   {"op":"stat",   "path":P}
 *   {"op":"read",   "path":P, "offset":N, "length":N}
 *   {"op":"put",    "path":P, "data":HEX, "overwrite":B}
 *   {"op":"list",   "path":P}
 *   {"op":"rename", "src":P, "dst":P}
 *   {"op":"delete", "path":P, "recursive":B}
 *
 * Responses:
 *   {"ok":true, ...operation fields...}
 *   {"ok":false, "error":KIND, "message":TEXT, "path":P}
 * where KIND is ErrorKindToString() of the server-side failure.
 */
namespace protocol {

constexpr uint16_t DEFAULT_PORT = 9610;

// Largest request or response line accepted (hex doubles payload size)
constexpr size_t MAX_MESSAGE_SIZE = 64 * 1024 * 1024;

// Largest file a remote client may upload in one put. Bounds the size of a
// commit file written through the remote backend.
constexpr size_t MAX_PUT_PAYLOAD = (MAX_MESSAGE_SIZE - 64 * 1024) / 2;

// Largest single "read" chunk the server will return
constexpr size_t MAX_READ_CHUNK = 4 * 1024 * 1024;

constexpr size_t DEFAULT_READ_CHUNK = 64 * 1024;

constexpr const char *URI_SCHEME = "cfs";

namespace ops {
constexpr const char *EXISTS = "exists";
constexpr const char *STAT = "stat";
constexpr const char *READ = "read";
constexpr const char *PUT = "put";
constexpr const char *LIST = "list";
constexpr const char *RENAME = "rename";
constexpr const char *DELETE = "delete";
} // namespace ops

} // namespace protocol
} // namespace rpc
} // namespace commitlog

#endif // COMMITLOG_RPC_PROTOCOL_HPP
