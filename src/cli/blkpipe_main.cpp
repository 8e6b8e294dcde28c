/**
 * @file blkpipe_main.cpp
 * @brief blkpipe: parallel, order-preserving block device transfer.
 *
 * ## Usage
 *
 *     blkpipe -mode=read  -device=/dev/vdb [-bs=65536] [-workers=4] | ingest-tool
 *     restore-tool | blkpipe -mode=write -device=/dev/vdb [-bs=65536] [-workers=4]
 *
 * Raw device bytes go to stdout (read) or come from stdin (write) with no framing. Progress
 * lines and log records go to stderr.
 *
 * Exit status: 0 success, 1 usage or configuration error, 2 transfer failure.
 */
#include "blkpipe_cli.hpp"

#include <csignal>
#include <iostream>
#include <memory>

#include <unistd.h>

using namespace blkpipe::utils;
using namespace blkpipe::transfer;

namespace
{
constexpr int kExitUsage = 1;
constexpr int kExitTransferFailed = 2;

int run_transfer(const blkpipe::cli::TransferConfig &config)
{
    const auto mode = *config.mode;
    auto opened = FileDevice::open(
        config.device, mode == blkpipe::cli::TransferMode::Read ? OpenMode::Read : OpenMode::Write);
    if (opened.is_error())
    {
        LOGGER_ERROR("{}", opened.error().describe());
        std::cerr << "Error: " << opened.error().describe() << "\n";
        return kExitTransferFailed;
    }
    std::unique_ptr<FileDevice> device = std::move(opened).content();
    LOGGER_INFO("Opened '{}' for {}: {} bytes (size from {}).", device->description(),
                blkpipe::cli::to_string(mode), device->size(),
                to_string(device->geometry().method));

    const PipelineOptions options = config.to_pipeline_options();
    TransferResult result;
    if (mode == blkpipe::cli::TransferMode::Read)
    {
        FdByteSink sink(STDOUT_FILENO);
        result = run_read_pipeline(options, *device, sink);
    }
    else
    {
        FdByteSource source(STDIN_FILENO);
        result = run_write_pipeline(options, *device, source);
    }

    if (result.is_error())
    {
        std::cerr << "Error: " << blkpipe::cli::progress_label(mode)
                  << " failed: " << result.error().describe() << "\n";
        return kExitTransferFailed;
    }
    return 0;
}
} // anonymous namespace

int main(int argc, char *argv[])
{
    // A closed stdout must surface as EPIPE from write(), not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    // ── Parse arguments ───────────────────────────────────────────────────────
    blkpipe::cli::CliArgs args;
    try
    {
        args = blkpipe::cli::parse_cli(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        blkpipe::cli::print_usage(std::cerr, argv[0]);
        return kExitUsage;
    }
    if (args.help)
    {
        blkpipe::cli::print_usage(std::cout, argv[0]);
        return 0;
    }

    // ── Load config ───────────────────────────────────────────────────────────
    blkpipe::cli::TransferConfig config;
    try
    {
        config = blkpipe::cli::resolve_config(args);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return kExitUsage;
    }

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule()));

    auto &logger = Logger::instance();
    logger.set_level(config.logger_level());
    if (!config.log_file.empty() && !logger.set_logfile(config.log_file))
    {
        std::cerr << "Error: cannot open log file '" << config.log_file << "'\n";
        return kExitUsage;
    }
    LOGGER_DEBUG("blkpipe {} (pid {})", blkpipe::platform::get_version_string(),
                 blkpipe::platform::get_pid());

    return run_transfer(config);
}
