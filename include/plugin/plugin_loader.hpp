#pragma once

#include "core/error.hpp"
#include "plugin/plugin_interface.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace pluginhost {

// RAII wrapper for a plugin's loaded entry module
class LoadedModule {
public:
    LoadedModule(std::string path, void* handle);
    ~LoadedModule();

    // Non-copyable, movable
    LoadedModule(const LoadedModule&) = delete;
    LoadedModule& operator=(const LoadedModule&) = delete;
    LoadedModule(LoadedModule&& other) noexcept;
    LoadedModule& operator=(LoadedModule&& other) noexcept;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] void* handle() const { return handle_; }

    // Resolve symbol from the shared library
    [[nodiscard]] void* resolve(const char* symbol) const;

private:
    void release();

    std::string path_;
    void* handle_;

public:
    // Plugin instance (owned, destroyed before dlclose)
    HostedPlugin* plugin = nullptr;
};

/**
 * @brief dlopen a plugin's entry module and create its instance
 *
 * Checks the factory symbol, the ABI version and that the module reports
 * the expected plugin id.
 * Errors: SANDBOX_INIT_FAILURE
 */
[[nodiscard]] Result<std::unique_ptr<LoadedModule>> load_plugin_module(
    const std::filesystem::path& path, const std::string& expected_id);

} // namespace pluginhost
