#pragma once

#include <string>

namespace blkpipe::tests::worker::logger
{

int test_basic_logging(const std::string &log_path);
int test_log_level_filtering(const std::string &log_path);
int test_sink_switching(const std::string &first_path, const std::string &second_path);
int test_multithread_stress(const std::string &log_path);
int test_flush_waits_for_queue(const std::string &log_path);
int test_shutdown_idempotency(const std::string &log_path);
int test_write_error_callback();
int test_use_before_init_aborts();

} // namespace blkpipe::tests::worker::logger
