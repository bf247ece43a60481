#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "wdserver/core/error.hpp"
#include "wdserver/core/types.hpp"
#include "wdserver/drivers/driver.hpp"
#include "wdserver/drivers/module.hpp"
#include "wdserver/drivers/module_loader.hpp"

namespace wdserver::drivers {

/// Called synchronously when a registration fails, with the descriptor as
/// given and a DriverRegistrationFailed error whose message is the reason.
using RegistrationFailedCallback =
    std::function<void(std::string_view type_descriptor, const Error& error)>;

/// A parsed "TypeName" or "TypeName, ModuleName" descriptor.
struct TypeDescriptor {
    std::string type_name;
    std::optional<std::string> module_name;
};

/// Parse a type descriptor. Fails with InvalidArgument when the type name is
/// empty or more than one module qualifier is present.
auto parse_type_descriptor(std::string_view descriptor) -> Result<TypeDescriptor>;

/// Maps requested capability sets to driver backend types.
///
/// Registration resolves a type descriptor through the module loader,
/// loading the named module from the driver library directory on first
/// reference. Failures never reach the caller as errors: they are logged and
/// delivered to the optional callback, and the registry is left unchanged.
class DriverRegistry {
public:
    DriverRegistry(ModuleLoader& modules, std::filesystem::path library_dir);

    DriverRegistry(const DriverRegistry&) = delete;
    DriverRegistry& operator=(const DriverRegistry&) = delete;

    /// Register the type named by `type_descriptor` for `capabilities`.
    /// A registration whose capability set equals an existing entry's
    /// replaces that entry.
    /// @returns true if the driver was registered.
    auto register_driver(const Capabilities& capabilities,
                         std::string_view type_descriptor,
                         const RegistrationFailedCallback& on_failed = {}) -> bool;

    /// Find the registration best matching `requested`: every key of the
    /// registered set must be present with an equal value. More specific
    /// registrations win; among equals the most recent one wins.
    [[nodiscard]] auto resolve(const Capabilities& requested) const -> std::optional<BackendType>;

    /// Instantiate a driver for `requested`.
    auto create_driver(const Capabilities& requested) const -> Result<std::unique_ptr<Driver>>;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto library_dir() const -> const std::filesystem::path&;

private:
    struct Entry {
        Capabilities capabilities;
        BackendType type;
    };

    auto load_type(const TypeDescriptor& descriptor) -> Result<BackendType>;
    auto find_module(std::string_view module_name) -> Result<DriverModule*>;

    ModuleLoader& modules_;
    std::filesystem::path library_dir_;

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace wdserver::drivers
