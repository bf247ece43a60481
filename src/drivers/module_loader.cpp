#include "wdserver/drivers/module_loader.hpp"
#include "wdserver/core/logger.hpp"

#include <algorithm>
#include <filesystem>

#if defined(__unix__) || defined(__APPLE__)
#include <dlfcn.h>
#elif defined(_WIN32)
#include <windows.h>
#else
#error "ModuleLoader: unsupported platform."
#endif

namespace wdserver::drivers {

namespace fs = std::filesystem;

namespace {

auto shared_library_extension() -> std::string_view {
#if defined(__APPLE__)
    return ".dylib";
#elif defined(_WIN32)
    return ".dll";
#else
    return ".so";
#endif
}

auto is_shared_library(const fs::path& path) -> bool {
#if defined(__APPLE__)
    auto ext = path.extension().string();
    return ext == ".dylib" || ext == ".so";
#else
    return path.extension() == shared_library_extension();
#endif
}

void close_library(void* handle, std::string_view name) {
    if (!handle) return;
#ifdef _WIN32
    ::FreeLibrary(static_cast<HMODULE>(handle));
    (void)name;
#else
    if (dlclose(handle) != 0) {
        const char* err = dlerror();
        LOG_WARN("dlclose warning for '{}': {}", name, err ? err : "unknown");
    }
#endif
}

} // anonymous namespace

ModuleLoader::~ModuleLoader() {
    unload_all();
}

auto ModuleLoader::library_file_name(std::string_view module_name) -> std::string {
    return std::string(module_name) + std::string(shared_library_extension());
}

auto ModuleLoader::add(std::unique_ptr<DriverModule> module) -> DriverModule* {
    if (!module) {
        LOG_WARN("Attempted to add a null driver module");
        return nullptr;
    }

    auto name = std::string(module->name());
    if (auto it = loaded_.find(name); it != loaded_.end()) {
        LOG_WARN("Driver module '{}' already present; keeping the existing one", name);
        return it->second.module.get();
    }

    LOG_INFO("Added driver module '{}' v{} ({} type(s))",
             name, module->version(), module->types().size());

    DriverModule* raw_ptr = module.get();
    loaded_.emplace(name, LoadedModule{
        .handle = nullptr,
        .module = std::move(module),
        .path = {},
    });
    return raw_ptr;
}

auto ModuleLoader::load(const fs::path& path) -> Result<DriverModule*> {
    if (!fs::exists(path)) {
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "Driver library not found",
            path.string()));
    }

    if (!is_shared_library(path)) {
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "Not a shared library",
            path.string()));
    }

    LOG_INFO("Loading driver module from: {}", path.string());

#ifdef _WIN32
    HMODULE handle = ::LoadLibraryA(path.string().c_str());
    if (!handle) {
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "LoadLibrary failed",
            "GetLastError=" + std::to_string(::GetLastError())));
    }

    void* sym = reinterpret_cast<void*>(::GetProcAddress(handle, kDriverModuleFactorySymbol));
    if (!sym) {
        ::FreeLibrary(handle);
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "Factory symbol not found",
            std::string("Expected symbol '") + kDriverModuleFactorySymbol + "' in " +
                path.filename().string()));
    }
#else
    // RTLD_NOW: resolve all symbols immediately (fail fast on missing deps).
    // RTLD_LOCAL: do not export symbols to other loaded libraries.
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "dlopen failed",
            err ? err : "unknown error"));
    }

    dlerror();

    void* sym = dlsym(handle, kDriverModuleFactorySymbol);
    const char* sym_err = dlerror();
    if (sym_err || !sym) {
        dlclose(handle);
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "Factory symbol not found",
            std::string("Expected symbol '") + kDriverModuleFactorySymbol + "' in " +
                path.filename().string() +
                (sym_err ? std::string(": ") + sym_err : "")));
    }
#endif

    auto factory = reinterpret_cast<DriverModuleFactory>(sym);
    std::unique_ptr<DriverModule> module = factory();
    if (!module) {
        close_library(handle, path.filename().string());
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "Module factory returned nullptr",
            path.filename().string()));
    }

    auto name = std::string(module->name());
    LOG_INFO("Loaded driver module '{}' v{} from {}",
             name, module->version(), path.filename().string());

    if (auto it = loaded_.find(name); it != loaded_.end()) {
        // Registered backend types keep pointing into the existing module.
        LOG_WARN("Driver module '{}' already loaded; discarding {}",
                 name, path.filename().string());
        module.reset();
        close_library(reinterpret_cast<void*>(handle), name);
        return it->second.module.get();
    }

    DriverModule* raw_ptr = module.get();
    loaded_.emplace(name, LoadedModule{
        .handle = reinterpret_cast<void*>(handle),
        .module = std::move(module),
        .path = path,
    });

    return raw_ptr;
}

auto ModuleLoader::unload(std::string_view name) -> VoidResult {
    auto it = loaded_.find(std::string(name));
    if (it == loaded_.end()) {
        return std::unexpected(make_error(
            ErrorCode::NotFound,
            "Driver module not loaded",
            std::string(name)));
    }

    LOG_INFO("Unloading driver module '{}'", name);
    release(it->second, name);
    loaded_.erase(it);
    return ok_result();
}

auto ModuleLoader::unload_all() -> void {
    std::vector<std::string> names;
    names.reserve(loaded_.size());
    for (const auto& [name, _] : loaded_) {
        names.push_back(name);
    }

    for (const auto& name : names) {
        auto result = unload(name);
        if (!result.has_value()) {
            LOG_WARN("Failed to unload driver module '{}': {}",
                     name, result.error().what());
        }
    }
}

auto ModuleLoader::get(std::string_view name) const -> DriverModule* {
    auto it = loaded_.find(std::string(name));
    if (it == loaded_.end()) {
        return nullptr;
    }
    return it->second.module.get();
}

auto ModuleLoader::loaded_names() const -> std::vector<std::string_view> {
    std::vector<std::string_view> names;
    names.reserve(loaded_.size());
    for (const auto& [name, _] : loaded_) {
        names.push_back(name);
    }
    return names;
}

auto ModuleLoader::modules() const -> std::vector<DriverModule*> {
    std::vector<DriverModule*> result;
    result.reserve(loaded_.size());
    for (const auto& [_, entry] : loaded_) {
        result.push_back(entry.module.get());
    }
    // Deterministic search order for type lookups without a module name.
    std::ranges::sort(result, {}, [](const DriverModule* m) { return m->name(); });
    return result;
}

auto ModuleLoader::size() const noexcept -> size_t {
    return loaded_.size();
}

auto ModuleLoader::release(LoadedModule& entry, std::string_view name) -> void {
    // Destroy the module instance before its code is unmapped.
    entry.module.reset();
    close_library(entry.handle, name);
    entry.handle = nullptr;
}

} // namespace wdserver::drivers
