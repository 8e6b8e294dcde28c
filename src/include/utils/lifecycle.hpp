#pragma once
/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Dependency-aware application lifecycle manager.
 *
 * Modules (the Logger, for instance) register a `ModuleDef`. `initialize()` performs a
 * topological sort over the declared dependencies and runs the startup callbacks in that
 * order; `finalize()` runs the shutdown callbacks in reverse, each bounded by its timeout so
 * a hanging module cannot block process exit. A dependency cycle or a missing dependency is a
 * fatal error.
 *
 * `main` should orchestrate the lifecycle with the `LifecycleGuard` RAII helper:
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     blkpipe::utils::LifecycleGuard app_lifecycle(
 *         blkpipe::utils::MakeModDefList(blkpipe::utils::Logger::GetLifecycleModule()));
 *     LOGGER_INFO("started");
 *     // ...
 *     return 0;
 * } // app_lifecycle finalizes every module here
 * ```
 ******************************************************************************/
#include "bp_base.hpp"
#include "blkpipe_utils_export.h"

#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

namespace blkpipe::utils
{

class LifecycleManagerImpl;

/// @brief Helper factory: constructs a vector<ModuleDef> by moving the supplied ModuleDef args.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class BLKPIPE_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before initialize(); registering afterwards is
     *        a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /// Starts all registered modules in dependency order. Idempotent.
    void initialize(std::source_location loc);

    /// Shuts modules down in reverse start order. Idempotent.
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief Registers the given modules, initializes the application on construction and
 *        finalizes it on destruction.
 *
 * Only the first guard in a process owns the lifecycle. A second guard registers nothing,
 * prints a warning and leaves finalization to the owner.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        if (IsAppInitialized())
        {
            fmt::print(stderr,
                       "[BP_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but the "
                       "application is already initialized. This guard is inactive.\n",
                       format_tools::filename_only(loc.file_name()), loc.line());
            return;
        }
        for (auto &module : modules)
        {
            RegisterModule(std::move(module));
        }
        InitializeApp(loc);
        m_is_owner = true;
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            BP_DEBUG("[BP_LifeCycle] LifecycleGuard finalizing. ({}:{})",
                     format_tools::filename_only(m_loc.file_name()), m_loc.line());
            FinalizeApp(m_loc);
        }
    }

  private:
    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace blkpipe::utils
