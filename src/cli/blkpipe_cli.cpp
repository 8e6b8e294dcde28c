#include "blkpipe_cli.hpp"

#include <charconv>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace blkpipe::cli
{

namespace
{

uint64_t parse_number(std::string_view flag, std::string_view text)
{
    uint64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last)
    {
        throw std::invalid_argument("invalid value '" + std::string(text) + "' for -" +
                                    std::string(flag) + " (expected a non-negative integer)");
    }
    return value;
}

} // anonymous namespace

CliArgs parse_cli(int argc, const char *const argv[])
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg.size() < 2 || arg[0] != '-')
        {
            throw std::invalid_argument("unexpected argument: " + std::string(arg));
        }
        arg.remove_prefix(arg[1] == '-' ? 2 : 1);

        std::string_view name = arg;
        std::optional<std::string_view> inline_value;
        if (const auto eq = arg.find('='); eq != std::string_view::npos)
        {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        if (name == "help" || name == "h")
        {
            args.help = true;
            continue;
        }
        if (name == "no-progress" || name == "no-sync")
        {
            if (inline_value)
            {
                throw std::invalid_argument("flag -" + std::string(name) + " takes no value");
            }
            (name == "no-progress" ? args.progress : args.sync) = false;
            continue;
        }

        auto value = [&]() -> std::string_view
        {
            if (inline_value)
                return *inline_value;
            if (i + 1 >= argc)
                throw std::invalid_argument("flag needs an argument: -" + std::string(name));
            return argv[++i];
        };

        if (name == "device")
            args.device = std::string(value());
        else if (name == "mode")
            args.mode = std::string(value());
        else if (name == "bs")
            args.block_size = parse_number(name, value());
        else if (name == "workers")
            args.workers = parse_number(name, value());
        else if (name == "config")
            args.config_path = std::string(value());
        else if (name == "progress-interval-ms")
            args.progress_interval_ms = parse_number(name, value());
        else if (name == "log-level")
            args.log_level = std::string(value());
        else if (name == "log-file")
            args.log_file = std::string(value());
        else
            throw std::invalid_argument("flag provided but not defined: -" + std::string(name));
    }
    return args;
}

TransferConfig resolve_config(const CliArgs &args)
{
    TransferConfig cfg;
    if (args.config_path)
        cfg = TransferConfig::from_json_file(*args.config_path);

    if (args.mode)
        cfg.mode = parse_mode(*args.mode);
    if (args.device)
        cfg.device = *args.device;
    if (args.block_size)
        cfg.block_size = *args.block_size;
    if (args.workers)
        cfg.workers = *args.workers;
    if (args.progress_interval_ms)
        cfg.progress_interval_ms = *args.progress_interval_ms;
    if (args.progress)
        cfg.progress = *args.progress;
    if (args.sync)
        cfg.sync = *args.sync;
    if (args.log_level)
        cfg.log_level = *args.log_level;
    if (args.log_file)
        cfg.log_file = *args.log_file;

    cfg.validate();
    return cfg;
}

void print_usage(std::ostream &out, const char *prog)
{
    out << "Usage:\n"
        << "  " << prog << " -mode=read  -device=<path> [options] > image\n"
        << "  " << prog << " -mode=write -device=<path> [options] < image\n\n"
        << "Options:\n"
        << "  -device <path>              Block device or regular file (required)\n"
        << "  -mode <read|write>          read: device to stdout; write: stdin to device\n"
        << "  -bs <bytes>                 Block size in bytes (default 65536)\n"
        << "  -workers <n>                Concurrent I/O workers (default 4)\n"
        << "  --config <path>             JSON config file; flags override its values\n"
        << "  --progress-interval-ms <n>  Progress line interval (default 1000)\n"
        << "  --no-progress               Do not print progress lines\n"
        << "  --no-sync                   Skip the final fdatasync in write mode\n"
        << "  --log-level <level>         trace|debug|info|warning|error|system (default info)\n"
        << "  --log-file <path>           Append log records to a file instead of stderr\n"
        << "  --help                      Show this message\n";
}

} // namespace blkpipe::cli
