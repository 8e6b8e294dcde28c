#pragma once
/**
 * @file module_def.hpp
 * @brief Definition of a lifecycle-managed module: name, dependencies, startup and shutdown
 *        callbacks.
 *
 * A module is described by a `ModuleDef` and handed to the `LifecycleManager` (usually through
 * a `LifecycleGuard`), which starts modules in dependency order and shuts them down in reverse.
 */
#include "blkpipe_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace blkpipe::utils
{

class ModuleDefImpl;
class LifecycleManager;

/// Startup/shutdown callback. `arg` is the optional string given at registration (may be empty).
using LifecycleCallback = void (*)(const char *arg);

class BLKPIPE_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @throws std::invalid_argument if @p name is empty.
     * @throws std::length_error if @p name exceeds MAX_MODULE_NAME_LEN.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// The named module must be started before this one.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /// @param timeout How long finalize() waits for the callback before giving up on it.
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace blkpipe::utils
