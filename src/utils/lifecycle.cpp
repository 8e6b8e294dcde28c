/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * @see include/utils/lifecycle.hpp
 *
 * 1.  `initialize()` orders the registered modules with Kahn's algorithm (ties broken by
 *     registration order) and runs the startup callbacks in that order. A cycle or an unknown
 *     dependency panics before any module is started.
 *
 * 2.  `finalize()` runs shutdown callbacks in reverse start order. Each callback runs on its
 *     own thread with a real deadline (thread + flag + poll, detach on timeout); the state the
 *     thread touches is shared-owned so a detached thread never outlives it.
 ******************************************************************************/
#include "bp_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/ranges.h>

namespace
{

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name + " must not be empty.");
    }
    if (name.size() > blkpipe::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(blkpipe::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

struct ShutdownSlot
{
    std::atomic<bool> completed{false};
    std::string error;
};

/**
 * @brief Runs `func` on a thread and waits at most `timeout` for it. On timeout the thread is
 *        detached; it keeps its own reference to the completion slot.
 */
ShutdownOutcome timed_shutdown(const std::function<void()> &func, std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    auto slot = std::make_shared<ShutdownSlot>();
    std::thread thread(
        [func, slot]()
        {
            try
            {
                func();
            }
            catch (const std::exception &e)
            {
                slot->error = e.what();
            }
            slot->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!slot->completed.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(5);
        std::this_thread::sleep_for(kPollInterval);
    }
    thread.join();

    if (!slot->error.empty())
    {
        return {false, false, slot->error};
    }
    return {true, false, {}};
}

} // namespace

namespace blkpipe::utils
{

namespace lifecycle_internal
{
struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup{nullptr};
    std::string startup_arg;
    LifecycleCallback shutdown{nullptr};
    std::chrono::milliseconds shutdown_timeout{1000};
};
} // namespace lifecycle_internal

class ModuleDefImpl
{
  public:
    lifecycle_internal::InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    validate_module_name(dependency_name, "dependency name");
    pImpl->def.dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->def.startup = startup_func;
    pImpl->def.startup_arg.clear();
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    pImpl->def.startup = startup_func;
    pImpl->def.startup_arg = std::string(arg);
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    pImpl->def.shutdown = shutdown_func;
    pImpl->def.shutdown_timeout = timeout;
}

class LifecycleManagerImpl
{
  public:
    std::mutex mutex;
    std::vector<lifecycle_internal::InternalModuleDef> registered;
    std::vector<size_t> start_order; // indices into `registered`, in the order started
    bool initialized{false};
    bool finalized{false};

    std::vector<size_t> topological_order(std::source_location loc) const;
};

std::vector<size_t> LifecycleManagerImpl::topological_order(std::source_location loc) const
{
    std::map<std::string, size_t> by_name;
    for (size_t i = 0; i < registered.size(); ++i)
    {
        if (!by_name.emplace(registered[i].name, i).second)
        {
            BP_PANIC("[BP_LifeCycle] Module '{}' registered twice (initialize called from {}).",
                     registered[i].name, SRCLOC_TO_STR(loc));
        }
    }

    std::vector<size_t> pending_deps(registered.size(), 0);
    std::vector<std::vector<size_t>> dependents(registered.size());
    for (size_t i = 0; i < registered.size(); ++i)
    {
        for (const auto &dep : registered[i].dependencies)
        {
            auto it = by_name.find(dep);
            if (it == by_name.end())
            {
                BP_PANIC("[BP_LifeCycle] Module '{}' depends on unregistered module '{}'.",
                         registered[i].name, dep);
            }
            ++pending_deps[i];
            dependents[it->second].push_back(i);
        }
    }

    std::vector<size_t> order;
    order.reserve(registered.size());
    std::vector<bool> placed(registered.size(), false);
    while (order.size() < registered.size())
    {
        bool progressed = false;
        for (size_t i = 0; i < registered.size(); ++i)
        {
            if (placed[i] || pending_deps[i] != 0)
                continue;
            placed[i] = true;
            order.push_back(i);
            for (size_t d : dependents[i])
                --pending_deps[d];
            progressed = true;
        }
        if (!progressed)
        {
            std::vector<std::string> stuck;
            for (size_t i = 0; i < registered.size(); ++i)
                if (!placed[i])
                    stuck.push_back(registered[i].name);
            BP_PANIC("[BP_LifeCycle] Dependency cycle among modules: {}", fmt::join(stuck, ", "));
        }
    }
    return order;
}

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized)
    {
        BP_PANIC("[BP_LifeCycle] Module '{}' registered after initialization.",
                 module_def.pImpl->def.name);
    }
    pImpl->registered.push_back(std::move(module_def.pImpl->def));
}

void LifecycleManager::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized)
        return;
    pImpl->initialized = true;

    for (size_t idx : pImpl->topological_order(loc))
    {
        const auto &mod = pImpl->registered[idx];
        BP_DEBUG("[BP_LifeCycle] Starting module '{}'.", mod.name);
        if (mod.startup != nullptr)
        {
            try
            {
                mod.startup(mod.startup_arg.c_str());
            }
            catch (const std::exception &e)
            {
                BP_PANIC("[BP_LifeCycle] Startup of module '{}' failed: {}", mod.name, e.what());
            }
        }
        pImpl->start_order.push_back(idx);
    }
}

void LifecycleManager::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized || pImpl->finalized)
        return;
    pImpl->finalized = true;

    for (auto it = pImpl->start_order.rbegin(); it != pImpl->start_order.rend(); ++it)
    {
        const auto &mod = pImpl->registered[*it];
        if (mod.shutdown == nullptr)
            continue;
        const LifecycleCallback cb = mod.shutdown;
        const std::string arg = mod.startup_arg;
        const auto outcome = timed_shutdown([cb, arg]() { cb(arg.c_str()); }, mod.shutdown_timeout);
        if (outcome.timed_out)
        {
            fmt::print(stderr, "[BP_LifeCycle] WARNING: shutdown of module '{}' timed out after {} ms ({}).\n",
                       mod.name, mod.shutdown_timeout.count(), SRCLOC_TO_STR(loc));
        }
        else if (!outcome.success)
        {
            fmt::print(stderr, "[BP_LifeCycle] WARNING: shutdown of module '{}' threw: {}\n", mod.name,
                       outcome.exception_msg);
        }
    }
}

bool LifecycleManager::is_initialized()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->initialized;
}

bool LifecycleManager::is_finalized()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->finalized;
}

} // namespace blkpipe::utils
