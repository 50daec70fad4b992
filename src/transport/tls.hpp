/**
 * @file tls.hpp
 * @brief Validation of client TLS material before any handle is built.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

namespace remote_shipper {

/**
 * @brief Load and check the configured PEM files.
 *
 * Checks that the CA bundle holds at least one certificate, that the client
 * certificate and key are given together, parse, and belong to each other.
 * Any failure is reported as ErrorKind::Configuration. Nothing is kept: the
 * handles load the files themselves.
 */
Result<void> validate_tls(const TlsConfig& tls);

}  // namespace remote_shipper
