/**
 * @file config_mapper.h
 * @brief Conversion of structured source documents into flat transfer config
 */

#ifndef KCENON_FETCHER_CONFIG_CONFIG_MAPPER_H
#define KCENON_FETCHER_CONFIG_CONFIG_MAPPER_H

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>

namespace kcenon::fetcher {

/**
 * @brief Maps structured `ftp:` / `s3:` documents to the flat key set
 *
 * Example input:
 * @code
 * ftp:
 *   connection:
 *     protocol: sftp
 *     host: files.example.com
 *     auth: { username: reader, password: secret }
 *   scope: { path: /exports }
 *   file_select:
 *     include: { patterns: ["report_.*"], extensions: [".csv"] }
 *   sorting: { by: date_in_filename, date_format: "%Y%m%d" }
 *   date_window: { range: "T+14" }
 * instance_id: prod
 * @endcode
 *
 * Top-level keys other than the section key are copied through unless the
 * mapping already produced a key of the same name.
 */
class config_mapper {
public:
    [[nodiscard]] static auto map_ftp_config(const YAML::Node& structured) -> YAML::Node;
    [[nodiscard]] static auto map_s3_config(const YAML::Node& structured) -> YAML::Node;

    /**
     * @brief Parse a "T+N" range into N
     */
    [[nodiscard]] static auto parse_date_range(const std::string& range) -> std::optional<int>;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONFIG_CONFIG_MAPPER_H
