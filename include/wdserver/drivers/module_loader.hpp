#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wdserver/core/error.hpp"
#include "wdserver/drivers/module.hpp"

namespace wdserver::drivers {

/// Tracks the driver modules present in the process.
///
/// Modules are either added directly (linked into the server) or loaded from
/// shared libraries using dlopen/dlsym (Unix) or LoadLibrary/GetProcAddress
/// (Windows). The loader owns both the library handle and the module
/// instance and destroys the module before closing its handle.
///
/// Not synchronized; modules are added and loaded during startup.
class ModuleLoader {
public:
    ModuleLoader() = default;
    ~ModuleLoader();

    // Non-copyable, non-movable (owns library handles).
    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;
    ModuleLoader(ModuleLoader&&) = delete;
    ModuleLoader& operator=(ModuleLoader&&) = delete;

    /// Register a module that is already part of the process.
    /// A module of the same name already present is kept and returned.
    /// Returns nullptr for a null module.
    auto add(std::unique_ptr<DriverModule> module) -> DriverModule*;

    /// Load a module from a shared library file.
    /// @param path  Path to the .so / .dylib / .dll file.
    /// @returns     Non-owning pointer to the loaded module on success, or to
    ///              the module already present under the same name.
    auto load(const std::filesystem::path& path) -> Result<DriverModule*>;

    /// Unload a module by name, destroying the instance and closing the library.
    /// Drivers and backend types obtained from the module must be gone first.
    auto unload(std::string_view name) -> VoidResult;

    /// Unload all modules.
    auto unload_all() -> void;

    /// Returns a non-owning pointer to a module by name, or nullptr.
    [[nodiscard]] auto get(std::string_view name) const -> DriverModule*;

    /// Returns the names of all modules currently present.
    [[nodiscard]] auto loaded_names() const -> std::vector<std::string_view>;

    /// Returns every module currently present.
    [[nodiscard]] auto modules() const -> std::vector<DriverModule*>;

    [[nodiscard]] auto size() const noexcept -> size_t;

    /// File name of the shared library holding `module_name` on this platform.
    [[nodiscard]] static auto library_file_name(std::string_view module_name) -> std::string;

private:
    struct LoadedModule {
        void* handle = nullptr;  // null for linked-in modules
        std::unique_ptr<DriverModule> module;
        std::filesystem::path path;
    };

    auto release(LoadedModule& entry, std::string_view name) -> void;

    std::unordered_map<std::string, LoadedModule> loaded_;
};

} // namespace wdserver::drivers
