/**
 * @file job_config.h
 * @brief Per-job configuration and the manager that loads it
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_CONFIG_JOB_CONFIG_H
#define KCENON_FETCHER_CONFIG_JOB_CONFIG_H

#include "kcenon/fetcher/core/types.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::fetcher {

/**
 * @brief Status transitions reported to a job_config_manager
 */
enum class job_status {
    queued,
    running,
    completed,
    failed
};

[[nodiscard]] constexpr auto to_string(job_status status) -> std::string_view {
    switch (status) {
        case job_status::queued: return "QUEUED";
        case job_status::running: return "RUNNING";
        case job_status::completed: return "COMPLETED";
        case job_status::failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Everything a module needs to run one job
 *
 * raw_config is the job document as loaded. channel_config, fetcher_config
 * and environment_config are the lookup layers used by lookup().
 */
struct job_config {
    std::string job_id;
    std::string service_id;
    int channel_number = 0;
    std::string source_type;

    YAML::Node environment_config{YAML::NodeType::Map};
    YAML::Node channel_config{YAML::NodeType::Map};
    YAML::Node fetcher_config{YAML::NodeType::Map};
    YAML::Node raw_config{YAML::NodeType::Map};

    /**
     * @brief Look up @p key in channel, then fetcher, then environment config
     * @return The first defined, non-null value or std::nullopt
     */
    [[nodiscard]] auto lookup(const std::string& key) const -> std::optional<YAML::Node>;

    /**
     * @brief lookup() rendered as a string; sequences and maps are dumped
     */
    [[nodiscard]] auto lookup_string(const std::string& key) const -> std::optional<std::string>;
};

/**
 * @brief Source of job configurations and sink for job status
 */
class job_config_manager {
public:
    virtual ~job_config_manager() = default;

    [[nodiscard]] virtual auto fetch_job_config(const std::string& job_id,
                                                const std::string& service_id)
        -> result<job_config> = 0;

    virtual void update_job_status(const std::string& job_id,
                                   const std::string& service_id,
                                   job_status status) = 0;
};

/**
 * @brief job_config_manager reading one YAML document per job
 *
 * The document is `<dir>/<job_id>_<service_id>.yaml` when that file exists,
 * `<dir>/<job_id>.yaml` otherwise. Recognised top-level keys:
 *
 * @code
 * channel_number: 7
 * source_type: sftp          # optional when an ftp: or s3: section is present
 * environment: { region: eu-west-1 }
 * channel: { upload_directory: /srv/outbox }
 * fetcher: { timeout: 60 }
 * ftp: { connection: { ... }, scope: { ... } }
 * @endcode
 *
 * Status updates are logged only.
 */
class yaml_job_config_manager : public job_config_manager {
public:
    explicit yaml_job_config_manager(std::filesystem::path config_dir);

    [[nodiscard]] auto fetch_job_config(const std::string& job_id,
                                        const std::string& service_id)
        -> result<job_config> override;

    void update_job_status(const std::string& job_id,
                           const std::string& service_id,
                           job_status status) override;

    /**
     * @brief Build a job_config from an already parsed document
     */
    [[nodiscard]] static auto from_document(const std::string& job_id,
                                            const std::string& service_id,
                                            const YAML::Node& document)
        -> result<job_config>;

    [[nodiscard]] auto config_dir() const -> const std::filesystem::path& { return config_dir_; }

private:
    std::filesystem::path config_dir_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_CONFIG_JOB_CONFIG_H
