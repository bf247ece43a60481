#include "wdserver/drivers/driver_registry.hpp"

#include <mutex>

#include "wdserver/core/logger.hpp"
#include "wdserver/core/utils.hpp"

namespace wdserver::drivers {

namespace fs = std::filesystem;

namespace {

/// True when every key/value pair of `registered` appears in `requested`.
auto capabilities_match(const Capabilities& registered, const Capabilities& requested) -> bool {
    if (!registered.is_object()) return false;
    if (registered.empty()) return true;
    if (!requested.is_object()) return false;

    for (const auto& [key, value] : registered.items()) {
        auto it = requested.find(key);
        if (it == requested.end() || *it != value) {
            return false;
        }
    }
    return true;
}

auto find_type(const DriverModule& module, std::string_view type_name) -> const BackendType* {
    for (const auto& type : module.types()) {
        if (utils::iequals(type.name, type_name)) {
            return &type;
        }
    }
    return nullptr;
}

} // anonymous namespace

auto parse_type_descriptor(std::string_view descriptor) -> Result<TypeDescriptor> {
    auto parts = utils::split(descriptor, ',');
    if (parts.empty() || parts.size() > 2) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Malformed type descriptor",
            std::string(descriptor)));
    }

    TypeDescriptor parsed;
    parsed.type_name = utils::trim(parts[0]);
    if (parsed.type_name.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Type descriptor names no type",
            std::string(descriptor)));
    }

    if (parts.size() == 2) {
        auto module_name = utils::trim(parts[1]);
        if (module_name.empty()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidArgument,
                "Type descriptor has an empty module name",
                std::string(descriptor)));
        }
        parsed.module_name = std::move(module_name);
    }
    return parsed;
}

DriverRegistry::DriverRegistry(ModuleLoader& modules, fs::path library_dir)
    : modules_(modules), library_dir_(std::move(library_dir)) {
    LOG_DEBUG("Driver registry using library directory {}", library_dir_.string());
}

auto DriverRegistry::register_driver(const Capabilities& capabilities,
                                     std::string_view type_descriptor,
                                     const RegistrationFailedCallback& on_failed) -> bool {
    auto fail = [&](std::string reason) {
        auto error = make_error(ErrorCode::DriverRegistrationFailed, std::move(reason));
        LOG_WARN("Driver registration failed for '{}': [{}] {}", type_descriptor,
                 error_code_to_string(error.code()), error.what());
        if (on_failed) {
            on_failed(type_descriptor, error);
        }
        return false;
    };

    if (!capabilities.is_object()) {
        return fail("Capabilities must be a JSON object");
    }

    auto descriptor = parse_type_descriptor(type_descriptor);
    if (!descriptor) {
        return fail(descriptor.error().what());
    }

    std::string reason;
    {
        // Held across module loading: the loader is not synchronized and
        // registrations are serialized against each other and against lookups.
        std::unique_lock lock(mutex_);

        auto type = load_type(*descriptor);
        if (!type) {
            reason = type.error().what();
        } else if (!type->is_driver()) {
            reason = "Type '" + type->name + "' does not implement Driver";
        } else {
            for (auto& entry : entries_) {
                if (entry.capabilities == capabilities) {
                    LOG_WARN("Replacing driver registration {} ({} -> {})",
                             capabilities.dump(), entry.type.name, type->name);
                    entry.type = std::move(*type);
                    return true;
                }
            }

            LOG_INFO("Registered driver '{}' for capabilities {}",
                     type->name, capabilities.dump());
            entries_.push_back(Entry{capabilities, std::move(*type)});
            return true;
        }
    }

    // Reported outside the lock so callbacks may query the registry.
    return fail(std::move(reason));
}

auto DriverRegistry::resolve(const Capabilities& requested) const -> std::optional<BackendType> {
    std::shared_lock lock(mutex_);

    const Entry* best = nullptr;
    for (const auto& entry : entries_) {
        if (!capabilities_match(entry.capabilities, requested)) continue;
        // Later entries win ties, so compare with >=.
        if (!best || entry.capabilities.size() >= best->capabilities.size()) {
            best = &entry;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return best->type;
}

auto DriverRegistry::create_driver(const Capabilities& requested) const
    -> Result<std::unique_ptr<Driver>> {
    auto type = resolve(requested);
    if (!type) {
        return std::unexpected(make_error(
            ErrorCode::SessionCreationFailed,
            "No driver registered for capabilities",
            requested.dump()));
    }

    auto driver = type->create_driver();
    if (!driver) {
        return std::unexpected(make_error(
            ErrorCode::SessionCreationFailed,
            "Driver instantiation failed",
            type->name));
    }

    LOG_DEBUG("Instantiated driver '{}'", type->name);
    return driver;
}

auto DriverRegistry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

auto DriverRegistry::library_dir() const -> const fs::path& {
    return library_dir_;
}

auto DriverRegistry::load_type(const TypeDescriptor& descriptor) -> Result<BackendType> {
    if (descriptor.module_name) {
        auto module = find_module(*descriptor.module_name);
        if (!module) {
            return std::unexpected(module.error());
        }

        const auto* type = find_type(**module, descriptor.type_name);
        if (!type) {
            return std::unexpected(make_error(
                ErrorCode::NotFound,
                "Type not found in module",
                descriptor.type_name + " (module " + *descriptor.module_name + ")"));
        }
        return *type;
    }

    for (const auto* module : modules_.modules()) {
        if (const auto* type = find_type(*module, descriptor.type_name)) {
            return *type;
        }
    }
    return std::unexpected(make_error(
        ErrorCode::NotFound,
        "Type not found in any loaded module",
        descriptor.type_name));
}

auto DriverRegistry::find_module(std::string_view module_name) -> Result<DriverModule*> {
    if (auto* module = modules_.get(module_name)) {
        return module;
    }

    auto path = library_dir_ / ModuleLoader::library_file_name(module_name);
    auto loaded_before = modules_.size();
    auto loaded = modules_.load(path);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    if ((*loaded)->name() != module_name) {
        std::string provided((*loaded)->name());
        // Only a module this lookup brought in is unloaded; one that was
        // already present keeps serving its registrations.
        if (modules_.size() > loaded_before) {
            if (auto unloaded = modules_.unload(provided); !unloaded) {
                LOG_WARN("Failed to unload module '{}': {}", provided, unloaded.error().what());
            }
        }
        return std::unexpected(make_error(
            ErrorCode::ModuleLoadFailed,
            "Library provides a different module",
            path.filename().string() + " provides '" + provided +
                "', expected '" + std::string(module_name) + "'"));
    }
    return *loaded;
}

} // namespace wdserver::drivers
