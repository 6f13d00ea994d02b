/**
 * @file connection_resolver.h
 * @brief Builds remote filesystem handles from configuration
 * @version 0.1.0
 *
 * create_connection() never throws. On failure it logs an actionable message
 * and returns an empty handle with empty options.
 */

#ifndef KCENON_FETCHER_CONNECTION_CONNECTION_RESOLVER_H
#define KCENON_FETCHER_CONNECTION_CONNECTION_RESOLVER_H

#include "http_client.h"
#include "remote_filesystem.h"
#include "kcenon/fetcher/config/transfer_config.h"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace kcenon::fetcher {

/**
 * @brief Categories of FTP/SFTP/local connection failures
 */
enum class connection_failure_kind {
    timeout,
    host_not_found,
    connection_refused,
    network_unreachable,
    authentication_failed,
    passive_mode,
    data_connection,
    ssh_handshake,
    ssh_key_authentication,
    permission_denied,
    generic
};

/**
 * @brief Categories of object store connection failures
 */
enum class s3_failure_kind {
    authentication_failed,
    bucket_not_found,
    region_mismatch,
    timeout,
    generic
};

template <typename Kind>
struct classified_failure {
    Kind kind;
    std::string message;
};

/**
 * @brief Classify a connection failure against @p host
 *
 * The error code is consulted first; otherwise the message is matched in
 * this order: timeout, host not found, refused, unreachable,
 * authentication, passive mode, data connection, SSH handshake, SSH key,
 * permission denied.
 */
[[nodiscard]] auto classify_connection_error(const error& err, const std::string& host)
    -> classified_failure<connection_failure_kind>;

/**
 * @brief Classify an object store failure against @p bucket
 */
[[nodiscard]] auto classify_s3_error(const error& err, const std::string& bucket)
    -> classified_failure<s3_failure_kind>;

using connection_options = std::map<std::string, std::string>;

/**
 * @brief Outcome of create_connection()
 */
struct resolved_connection {
    std::shared_ptr<remote_filesystem> filesystem;
    connection_options options;
    /// Classified failure message (empty on success)
    std::string failure;

    [[nodiscard]] explicit operator bool() const noexcept { return filesystem != nullptr; }
};

/**
 * @brief Collaborators injected into create_connection()
 */
struct connection_dependencies {
    /// Transport for object stores (default: http_client)
    std::shared_ptr<http_client_interface> http;
};

/**
 * @brief Build and probe a remote filesystem handle
 *
 * local: creates the root path when missing, then lists it.
 * ftp/sftp: lists the root path.
 * s3: lists the bucket root.
 */
[[nodiscard]] auto create_connection(const transfer_config& config,
                                     const connection_dependencies& deps = {})
    -> resolved_connection;

/**
 * @brief Connection constructor used by components that reconnect
 */
using connection_factory = std::function<resolved_connection(const transfer_config&)>;

[[nodiscard]] auto default_connection_factory() -> connection_factory;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONNECTION_CONNECTION_RESOLVER_H
