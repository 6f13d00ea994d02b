/**
 * @file transfer_state_store.h
 * @brief Persisted resume state for download runs
 * @version 0.1.0
 *
 * One JSON document per (instance_id, channel_id) key records which remote
 * paths were downloaded and which are still outstanding, so an interrupted
 * run can pick up where it stopped.
 */

#ifndef KCENON_FETCHER_PIPELINE_TRANSFER_STATE_STORE_H
#define KCENON_FETCHER_PIPELINE_TRANSFER_STATE_STORE_H

#include "kcenon/fetcher/core/types.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::fetcher {

/**
 * @brief Resume state of one transfer key
 */
struct transfer_state {
    std::vector<std::string> processed_files;  ///< Remote paths already downloaded
    std::vector<std::string> remaining_files;  ///< Remote paths still outstanding
    std::chrono::system_clock::time_point timestamp;  ///< Last save time

    [[nodiscard]] auto empty() const -> bool {
        return processed_files.empty() && remaining_files.empty();
    }
};

/**
 * @brief Key of a persisted state document
 */
struct transfer_state_key {
    std::string instance_id = "default";
    std::string channel_id = "default";
};

/**
 * @brief File-backed store of transfer states
 *
 * Documents live at <directory>/transfer_state_<instance>_<channel>.json,
 * with path separators in the key replaced by '_'. A save writes a sibling
 * ".tmp" file and renames it over the document.
 * Saves from different threads are serialized; concurrent writers to the
 * same key from different processes are not supported.
 */
class transfer_state_store {
public:
    /**
     * @brief Construct over @p directory (empty = system temp directory)
     */
    explicit transfer_state_store(std::filesystem::path directory = {});

    ~transfer_state_store();

    transfer_state_store(const transfer_state_store&) = delete;
    auto operator=(const transfer_state_store&) -> transfer_state_store& = delete;
    transfer_state_store(transfer_state_store&&) noexcept;
    auto operator=(transfer_state_store&&) noexcept -> transfer_state_store&;

    /**
     * @brief Persist @p processed and @p remaining with the current time
     */
    [[nodiscard]] auto save(const transfer_state_key& key,
                            const std::vector<std::string>& processed,
                            const std::vector<std::string>& remaining) -> result<void>;

    /**
     * @brief Load the state for @p key
     *
     * A missing document yields an empty state, not an error.
     * @return state_corrupted when the document cannot be parsed
     */
    [[nodiscard]] auto load(const transfer_state_key& key) const -> result<transfer_state>;

    /**
     * @brief Remove the state for @p key (missing documents are not an error)
     */
    [[nodiscard]] auto clear(const transfer_state_key& key) -> result<void>;

    [[nodiscard]] auto exists(const transfer_state_key& key) const -> bool;

    [[nodiscard]] auto path_for(const transfer_state_key& key) const -> std::filesystem::path;

    [[nodiscard]] auto directory() const -> const std::filesystem::path&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Serialize a state document (two-space indentation)
 */
[[nodiscard]] auto serialize_transfer_state(const transfer_state& state) -> std::string;

/**
 * @brief Parse a state document
 */
[[nodiscard]] auto deserialize_transfer_state(const std::string& json) -> result<transfer_state>;

}  // namespace kcenon::fetcher

#endif  // KCENON_FETCHER_PIPELINE_TRANSFER_STATE_STORE_H
