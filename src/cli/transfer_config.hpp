#pragma once
/**
 * @file transfer_config.hpp
 * @brief Settings of one blkpipe invocation, optionally loaded from a JSON file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "mode":                 "read",
 *   "device":               "/dev/vdb",
 *   "block_size":           1048576,
 *   "workers":              8,
 *   "progress_interval_ms": 1000,
 *   "progress":             true,
 *   "sync":                 true,
 *   "log_level":            "info",
 *   "log_file":             "/var/log/blkpipe.log"
 * }
 * @endcode
 *
 * Every key is optional in the file; mode and device must be set by the file or the command
 * line before validate() passes. Unknown keys are rejected.
 */
#include "bp_transfer.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace blkpipe::cli
{

enum class TransferMode
{
    Read,  ///< device -> stdout
    Write, ///< stdin -> device
};

/// "read" or "write". @throws std::runtime_error otherwise.
TransferMode parse_mode(std::string_view text);

const char *to_string(TransferMode mode) noexcept;

/// "READ" / "WRITE", the label of progress lines.
const char *progress_label(TransferMode mode) noexcept;

inline constexpr uint64_t kMaxBlockSize = 1ull << 30; // 1 GiB
inline constexpr uint64_t kMaxWorkers = 1024;

struct TransferConfig
{
    std::optional<TransferMode> mode;
    std::string device;
    uint64_t block_size{transfer::kDefaultBlockSize};
    uint64_t workers{transfer::kDefaultWorkers};
    uint64_t progress_interval_ms{
        static_cast<uint64_t>(transfer::kDefaultProgressInterval.count())};
    bool progress{true};
    bool sync{true};
    std::string log_level{"info"};
    std::string log_file;

    /**
     * @brief Overlay the keys present in @p j onto this config.
     * @param origin Named in error messages (a file path, for instance).
     * @throws std::runtime_error on unknown keys or values of the wrong type.
     */
    void apply_json(const nlohmann::json &j, const std::string &origin);

    /// Defaults overlaid with the file at @p path. @throws std::runtime_error.
    static TransferConfig from_json_file(const std::string &path);

    /// @throws std::runtime_error naming the first invalid setting.
    void validate() const;

    /// The engine options this config maps to. Call after validate().
    [[nodiscard]] transfer::PipelineOptions to_pipeline_options() const;

    [[nodiscard]] utils::Logger::Level logger_level() const;
};

} // namespace blkpipe::cli
