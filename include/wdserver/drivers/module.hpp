#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "wdserver/drivers/driver.hpp"

namespace wdserver::drivers {

/// A named type exported by a driver module.
///
/// `create_driver` is empty when the type does not implement Driver; such a
/// type can be resolved by name but never registered.
struct BackendType {
    std::string name;
    std::function<std::unique_ptr<Driver>()> create_driver;

    [[nodiscard]] auto is_driver() const -> bool { return static_cast<bool>(create_driver); }
};

/// Describe type T for export from a module. Whether T implements Driver is
/// decided here, at compile time, so the host never inspects types at runtime.
template <typename T>
auto make_backend_type(std::string name) -> BackendType {
    BackendType type;
    type.name = std::move(name);
    if constexpr (std::is_base_of_v<Driver, T> && std::is_default_constructible_v<T>) {
        type.create_driver = [] { return std::unique_ptr<Driver>(std::make_unique<T>()); };
    }
    return type;
}

/// A unit exporting backend types: either linked into the server or loaded
/// from a shared library.
///
/// A shared library provides a module through an exported factory named
/// `wdserver_create_driver_module`. Lifecycle:
///   1. Host resolves the factory and calls it once.
///   2. Host looks up exported types by name through `types()`.
///   3. Host destroys the module before closing the library.
class DriverModule {
public:
    virtual ~DriverModule() = default;

    /// Module name used in "TypeName, ModuleName" descriptors.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    [[nodiscard]] virtual auto version() const -> std::string_view = 0;

    [[nodiscard]] virtual auto types() const -> const std::vector<BackendType>& = 0;
};

/// Factory function type that shared libraries must export.
using DriverModuleFactory = std::unique_ptr<DriverModule>(*)();

/// Name of the exported factory symbol that the loader looks for.
inline constexpr const char* kDriverModuleFactorySymbol = "wdserver_create_driver_module";

} // namespace wdserver::drivers
