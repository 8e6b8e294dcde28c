// tests/test_layer2_service/workers/lifecycle_workers.cpp
/**
 * @file lifecycle_workers.cpp
 * @brief Worker scenarios for the LifecycleManager tests.
 *
 * Each scenario runs in its own process: the manager is a process-wide singleton that can be
 * initialized and finalized once, and several scenarios are expected to abort.
 */
#include "lifecycle_workers.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace blkpipe::utils;
using namespace blkpipe::tests::helper;
using namespace std::chrono_literals;

namespace
{

std::mutex g_events_mutex;
std::vector<std::string> g_events;

void record(const std::string &event)
{
    std::lock_guard<std::mutex> lock(g_events_mutex);
    g_events.push_back(event);
}

std::vector<std::string> events()
{
    std::lock_guard<std::mutex> lock(g_events_mutex);
    return g_events;
}

ModuleDef make_recording_module(const char *name)
{
    ModuleDef mod(name);
    mod.set_startup([](const char *arg) { record(std::string("start:") + arg); }, name);
    mod.set_shutdown([](const char *arg) { record(std::string("stop:") + arg); }, 1000ms);
    return mod;
}

int fail(const std::string &what)
{
    fmt::print(stderr, "[WORKER FAILURE] {}\n", what);
    return 1;
}

} // namespace

namespace blkpipe::tests::worker::lifecycle
{

int test_multiple_guards_warning()
{
    LifecycleGuard owner(MakeModDefList(make_recording_module("Owner")));
    {
        LifecycleGuard second(MakeModDefList(make_recording_module("Ignored")));
    }
    if (!IsAppInitialized())
        return fail("owner guard did not initialize the application");
    if (IsAppFinalized())
        return fail("inactive guard finalized the application");
    for (const auto &e : events())
    {
        if (e == "start:Ignored")
            return fail("module of the inactive guard was started");
    }
    return 0;
}

int test_dependency_order()
{
    {
        ModuleDef c = make_recording_module("C");
        c.add_dependency("B");
        ModuleDef b = make_recording_module("B");
        b.add_dependency("A");
        ModuleDef a = make_recording_module("A");

        LifecycleGuard guard(MakeModDefList(std::move(c), std::move(b), std::move(a)));
        const std::vector<std::string> started{"start:A", "start:B", "start:C"};
        if (events() != started)
            return fail("modules did not start in dependency order");
    }
    const std::vector<std::string> all{"start:A", "start:B", "start:C",
                                       "stop:C",  "stop:B",  "stop:A"};
    if (events() != all)
        return fail("modules did not stop in reverse start order");
    return 0;
}

int test_init_idempotency()
{
    RegisterModule(make_recording_module("Once"));
    InitializeApp();
    InitializeApp();
    if (events().size() != 1)
        return fail("second InitializeApp restarted modules");
    FinalizeApp();
    return 0;
}

int test_finalize_idempotency()
{
    RegisterModule(make_recording_module("Once"));
    InitializeApp();
    FinalizeApp();
    FinalizeApp();
    if (!IsAppFinalized())
        return fail("is_finalized is false after FinalizeApp");
    if (events().size() != 2)
        return fail("second FinalizeApp ran shutdown callbacks again");
    return 0;
}

int test_register_after_init_aborts()
{
    RegisterModule(make_recording_module("Early"));
    InitializeApp();
    RegisterModule(make_recording_module("Late"));
    return fail("registration after initialization did not abort");
}

int test_unresolved_dependency()
{
    ModuleDef mod = make_recording_module("Needy");
    mod.add_dependency("Missing");
    RegisterModule(std::move(mod));
    InitializeApp();
    return fail("unresolved dependency did not abort");
}

int test_duplicate_module()
{
    RegisterModule(make_recording_module("Twin"));
    RegisterModule(make_recording_module("Twin"));
    InitializeApp();
    return fail("duplicate module did not abort");
}

int test_static_circular_dependency_aborts()
{
    ModuleDef a = make_recording_module("CycleA");
    a.add_dependency("CycleB");
    ModuleDef b = make_recording_module("CycleB");
    b.add_dependency("CycleA");
    RegisterModule(std::move(a));
    RegisterModule(std::move(b));
    InitializeApp();
    return fail("dependency cycle did not abort");
}

int test_startup_exception_aborts()
{
    ModuleDef mod("Throwing");
    mod.set_startup([](const char *) { throw std::runtime_error("boom"); });
    RegisterModule(std::move(mod));
    InitializeApp();
    return fail("startup exception did not abort");
}

int test_shutdown_timeout_warns()
{
    ModuleDef mod("Sluggish");
    mod.set_shutdown([](const char *) { std::this_thread::sleep_for(2s); }, 50ms);
    const auto begin = std::chrono::steady_clock::now();
    {
        LifecycleGuard guard(MakeModDefList(std::move(mod)));
    }
    if (std::chrono::steady_clock::now() - begin > 1500ms)
        return fail("finalize waited for a shutdown callback past its timeout");
    return 0;
}

} // namespace blkpipe::tests::worker::lifecycle

namespace
{
struct LifecycleWorkerRegistrar
{
    LifecycleWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "lifecycle")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace blkpipe::tests::worker::lifecycle;
                if (scenario == "test_multiple_guards_warning")
                    return test_multiple_guards_warning();
                if (scenario == "test_dependency_order")
                    return test_dependency_order();
                if (scenario == "test_init_idempotency")
                    return test_init_idempotency();
                if (scenario == "test_finalize_idempotency")
                    return test_finalize_idempotency();
                if (scenario == "test_register_after_init_aborts")
                    return test_register_after_init_aborts();
                if (scenario == "test_unresolved_dependency")
                    return test_unresolved_dependency();
                if (scenario == "test_duplicate_module")
                    return test_duplicate_module();
                if (scenario == "test_static_circular_dependency_aborts")
                    return test_static_circular_dependency_aborts();
                if (scenario == "test_startup_exception_aborts")
                    return test_startup_exception_aborts();
                if (scenario == "test_shutdown_timeout_warns")
                    return test_shutdown_timeout_warns();
                fmt::print(stderr, "ERROR: Unknown lifecycle scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LifecycleWorkerRegistrar g_lifecycle_registrar;
} // namespace
