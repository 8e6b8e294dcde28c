// tests/test_framework/test_process_utils.cpp
/**
 * @file test_process_utils.cpp
 * @brief fork/exec based child process management for tests.
 */
#include "test_process_utils.h"
#include "shared_test_helpers.h" // read_file_contents

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fcntl.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace blkpipe::tests::helper
{

namespace
{

int wait_for_child_and_get_exit_code(ProcessHandle handle)
{
    if (handle == NULL_PROC_HANDLE)
        return -1;

    int status = 0;
    pid_t rc = 0;
    do
    {
        rc = waitpid(handle, &status, 0);
    } while (rc == -1 && errno == EINTR);
    if (rc == -1)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return -1;
}

void redirect(const char *path, int flags, int target_fd)
{
    int fd = open(path, flags, 0644);
    if (fd != -1)
    {
        dup2(fd, target_fd);
        close(fd);
    }
}

ProcessHandle spawn_process(const std::vector<std::string> &argv_strings,
                            const std::optional<fs::path> &stdin_path,
                            const fs::path &stdout_path, const fs::path &stderr_path)
{
    // Build argv before fork: the child must not allocate.
    std::vector<char *> argv;
    argv.reserve(argv_strings.size() + 1);
    for (const auto &a : argv_strings)
        argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);
    const std::string in_path = stdin_path ? stdin_path->string() : std::string("/dev/null");

    fflush(stdout);
    fflush(stderr);
    pid_t pid = fork();
    if (pid == 0)
    {
        redirect(in_path.c_str(), O_RDONLY, 0);
        redirect(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 1);
        redirect(stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 2);
        execv(argv[0], argv.data());
        _exit(127);
    }
    if (pid < 0)
    {
        BP_DEBUG("fork failed: {}", std::strerror(errno));
        return NULL_PROC_HANDLE;
    }
    return pid;
}

} // anonymous namespace

void WorkerProcess::make_capture_paths(const std::string &base_name)
{
    static std::atomic<unsigned> counter{0};
    std::string name = base_name;
    std::replace(name.begin(), name.end(), '.', '_');
    const auto ts = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto seq = counter.fetch_add(1);

    stdout_path_ = fs::temp_directory_path() /
                   fmt::format("{}_{}_{}_{}_stdout.log", name, getpid(), ts, seq);
    stderr_path_ = fs::temp_directory_path() /
                   fmt::format("{}_{}_{}_{}_stderr.log", name, getpid(), ts, seq);
}

WorkerProcess::WorkerProcess(const std::string &exe_path, const std::string &mode,
                             const std::vector<std::string> &args)
{
    make_capture_paths(fs::path(exe_path).filename().string() + "_" + mode);

    std::vector<std::string> argv{exe_path, mode};
    argv.insert(argv.end(), args.begin(), args.end());
    handle_ = spawn_process(argv, std::nullopt, stdout_path_, stderr_path_);
}

WorkerProcess::WorkerProcess(const std::string &program, const std::vector<std::string> &args,
                             const std::optional<fs::path> &stdin_path)
{
    make_capture_paths(fs::path(program).filename().string());

    std::vector<std::string> argv{program};
    argv.insert(argv.end(), args.begin(), args.end());
    handle_ = spawn_process(argv, stdin_path, stdout_path_, stderr_path_);
}

WorkerProcess::~WorkerProcess()
{
    if (handle_ != NULL_PROC_HANDLE && !waited_)
    {
        wait_for_exit();
    }
    std::error_code ec;
    fs::remove(stdout_path_, ec);
    fs::remove(stderr_path_, ec);
}

int WorkerProcess::wait_for_exit()
{
    if (waited_)
        return exit_code_;

    exit_code_ = wait_for_child_and_get_exit_code(handle_);
    waited_ = true;
    handle_ = NULL_PROC_HANDLE;

    read_file_contents(stdout_path_.string(), stdout_content_);
    read_file_contents(stderr_path_.string(), stderr_content_);
    return exit_code_;
}

const std::string &WorkerProcess::get_stdout() const
{
    if (!waited_)
        read_file_contents(stdout_path_.string(), stdout_content_);
    return stdout_content_;
}

const std::string &WorkerProcess::get_stderr() const
{
    if (!waited_)
        read_file_contents(stderr_path_.string(), stderr_content_);
    return stderr_content_;
}

void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings)
{
    using ::testing::HasSubstr;
    using ::testing::Not;

    ASSERT_TRUE(proc.valid()) << "WorkerProcess was not successfully spawned.";
    ASSERT_EQ(proc.exit_code(), 0) << "stderr:\n" << proc.get_stderr();

    const auto &stderr_out = proc.get_stderr();
    EXPECT_THAT(stderr_out, Not(HasSubstr("[ERROR ]")));
    EXPECT_THAT(stderr_out, Not(HasSubstr("PANIC")));
    EXPECT_THAT(stderr_out, Not(HasSubstr("[WORKER FAILURE]")));
    for (const auto &s : expected_stderr_substrings)
    {
        EXPECT_THAT(stderr_out, HasSubstr(s));
    }
}

} // namespace blkpipe::tests::helper
