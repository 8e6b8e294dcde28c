#pragma once
/**
 * @file blkpipe_cli.hpp
 * @brief Command-line parsing for the blkpipe executable.
 *
 * Flags take one or two leading dashes and a value either as the next argument or after '='
 * (`-bs 4096`, `--bs=4096`). Precedence: defaults, then `--config` file, then flags.
 */
#include "transfer_config.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace blkpipe::cli
{

struct CliArgs
{
    bool help{false};
    std::optional<std::string> config_path;
    std::optional<std::string> mode;
    std::optional<std::string> device;
    std::optional<uint64_t> block_size;
    std::optional<uint64_t> workers;
    std::optional<uint64_t> progress_interval_ms;
    std::optional<bool> progress;
    std::optional<bool> sync;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
};

/// @throws std::invalid_argument on unknown flags, missing values or malformed numbers.
CliArgs parse_cli(int argc, const char *const argv[]);

/// Load the config file if one was given, overlay the flags and validate.
/// @throws std::runtime_error
TransferConfig resolve_config(const CliArgs &args);

void print_usage(std::ostream &out, const char *prog);

} // namespace blkpipe::cli
