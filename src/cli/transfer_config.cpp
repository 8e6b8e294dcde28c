/**
 * @file transfer_config.cpp
 * @brief TransferConfig JSON parsing and validation.
 */
#include "transfer_config.hpp"

#include <array>
#include <fstream>
#include <stdexcept>

namespace blkpipe::cli
{

namespace
{

constexpr std::array<std::string_view, 9> kKnownKeys = {
    "mode",     "device", "block_size", "workers",  "progress_interval_ms",
    "progress", "sync",   "log_level",  "log_file",
};

[[noreturn]] void config_error(const std::string &origin, const std::string &what)
{
    throw std::runtime_error("Transfer config: " + what + " in '" + origin + "'");
}

uint64_t get_unsigned(const nlohmann::json &j, const char *key, const std::string &origin)
{
    const auto &v = j.at(key);
    if (v.is_number_unsigned())
        return v.get<uint64_t>();
    if (v.is_number_integer())
        config_error(origin, std::string("'") + key + "' must not be negative");
    config_error(origin, std::string("'") + key + "' must be a non-negative integer");
}

std::string get_string(const nlohmann::json &j, const char *key, const std::string &origin)
{
    const auto &v = j.at(key);
    if (!v.is_string())
        config_error(origin, std::string("'") + key + "' must be a string");
    return v.get<std::string>();
}

bool get_bool(const nlohmann::json &j, const char *key, const std::string &origin)
{
    const auto &v = j.at(key);
    if (!v.is_boolean())
        config_error(origin, std::string("'") + key + "' must be true or false");
    return v.get<bool>();
}

} // anonymous namespace

TransferMode parse_mode(std::string_view text)
{
    if (text == "read")
        return TransferMode::Read;
    if (text == "write")
        return TransferMode::Write;
    throw std::runtime_error("Transfer config: invalid mode '" + std::string(text) +
                             "' (must be 'read' or 'write')");
}

const char *to_string(TransferMode mode) noexcept
{
    return mode == TransferMode::Read ? "read" : "write";
}

const char *progress_label(TransferMode mode) noexcept
{
    return mode == TransferMode::Read ? "READ" : "WRITE";
}

void TransferConfig::apply_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
        config_error(origin, "top level must be a JSON object");

    for (const auto &item : j.items())
    {
        bool known = false;
        for (auto k : kKnownKeys)
            known = known || item.key() == k;
        if (!known)
            config_error(origin, "unknown key '" + item.key() + "'");
    }

    if (j.contains("mode"))
        mode = parse_mode(get_string(j, "mode", origin));
    if (j.contains("device"))
        device = get_string(j, "device", origin);
    if (j.contains("block_size"))
        block_size = get_unsigned(j, "block_size", origin);
    if (j.contains("workers"))
        workers = get_unsigned(j, "workers", origin);
    if (j.contains("progress_interval_ms"))
        progress_interval_ms = get_unsigned(j, "progress_interval_ms", origin);
    if (j.contains("progress"))
        progress = get_bool(j, "progress", origin);
    if (j.contains("sync"))
        sync = get_bool(j, "sync", origin);
    if (j.contains("log_level"))
        log_level = get_string(j, "log_level", origin);
    if (j.contains("log_file"))
        log_file = get_string(j, "log_file", origin);
}

TransferConfig TransferConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Transfer config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Transfer config: JSON parse error in '" + path +
                                 "': " + e.what());
    }

    TransferConfig cfg;
    cfg.apply_json(j, path);
    return cfg;
}

void TransferConfig::validate() const
{
    if (!mode.has_value())
        throw std::runtime_error("Transfer config: no mode specified (use -mode=read or "
                                 "-mode=write)");
    if (device.empty())
        throw std::runtime_error("Transfer config: no device specified (use -device)");
    if (block_size == 0 || block_size > kMaxBlockSize)
        throw std::runtime_error(fmt::format(
            "Transfer config: block size {} out of range (1..{})", block_size, kMaxBlockSize));
    if (workers == 0 || workers > kMaxWorkers)
        throw std::runtime_error(fmt::format(
            "Transfer config: worker count {} out of range (1..{})", workers, kMaxWorkers));
    if (progress_interval_ms == 0)
        throw std::runtime_error("Transfer config: progress interval must be at least 1 ms");
    if (!utils::Logger::parse_level(log_level).has_value())
        throw std::runtime_error(
            "Transfer config: invalid log level '" + log_level +
            "' (must be trace, debug, info, warning, error or system)");
}

transfer::PipelineOptions TransferConfig::to_pipeline_options() const
{
    transfer::PipelineOptions options;
    options.block_size = static_cast<uint32_t>(block_size);
    options.workers = static_cast<size_t>(workers);
    options.progress_interval = std::chrono::milliseconds(progress_interval_ms);
    options.progress = progress;
    options.sync = sync;
    return options;
}

utils::Logger::Level TransferConfig::logger_level() const
{
    return utils::Logger::parse_level(log_level).value_or(utils::Logger::Level::L_INFO);
}

} // namespace blkpipe::cli
