/**
 * @file module_factory.h
 * @brief Maps a job's source_type to a module
 * @version 0.1.0
 */

#ifndef KCENON_FETCHER_MODULE_MODULE_FACTORY_H
#define KCENON_FETCHER_MODULE_MODULE_FACTORY_H

#include "fetch_module.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::fetcher {

using module_creator = std::function<std::unique_ptr<fetch_module>(const job_config&)>;

/**
 * @brief Registry of module constructors keyed by source type
 *
 * Registration is not synchronized; register every type before sharing the
 * factory between threads. create() is safe to call concurrently.
 */
class module_factory {
public:
    module_factory() = default;

    /**
     * @brief Factory with file_source_module registered for ftp, sftp, s3 and local
     */
    [[nodiscard]] static auto with_default_modules(pipeline_dependencies deps = {})
        -> module_factory;

    /**
     * @brief Register (or replace) the constructor for @p source_type
     */
    void register_module(const std::string& source_type, module_creator creator);

    [[nodiscard]] auto create(const job_config& config) const
        -> result<std::unique_ptr<fetch_module>>;

    [[nodiscard]] auto supports(const std::string& source_type) const -> bool;

    [[nodiscard]] auto supported_types() const -> std::vector<std::string>;

private:
    std::map<std::string, module_creator> creators_;
};

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_MODULE_MODULE_FACTORY_H
