/**
 * @file packager.hpp
 * @brief Remote-write wire format: protobuf serialization + snappy block compression.
 * @author Dimitris Kafetzis
 *
 * Wire format of a request body:
 *   snappy_block( protobuf prometheus.WriteRequest )
 *
 * The snappy block format records the uncompressed length up front, so the
 * body is self-describing.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace remote_shipper {

// ─────────────────────────────────────────────
// Protocol headers
// ─────────────────────────────────────────────

inline constexpr std::string_view CONTENT_ENCODING = "snappy";
inline constexpr std::string_view CONTENT_TYPE = "application/x-protobuf";
inline constexpr std::string_view REMOTE_WRITE_VERSION_HEADER = "X-Prometheus-Remote-Write-Version";
inline constexpr std::string_view REMOTE_WRITE_VERSION = "0.1.0";

/**
 * @brief Serialize and compress a request into an HTTP body.
 *
 * Fails with ErrorKind::Encoding if protobuf serialization fails.
 */
Result<std::string> pack(const WriteRequest& request);

/**
 * @brief Inverse of pack(): decompress and parse a request body.
 *
 * Fails with ErrorKind::Encoding on a corrupt snappy block or an
 * unparsable message.
 */
Result<WriteRequest> unpack(std::string_view body);

}  // namespace remote_shipper
