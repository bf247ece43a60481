#pragma once

// Marks the module factory exported by a driver library, so it stays visible
// when the library is built with hidden symbol visibility.
#if defined(_MSC_VER)
    #define WDSERVER_MODULE_EXPORT __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
    #define WDSERVER_MODULE_EXPORT __attribute__((visibility("default")))
#else
    #define WDSERVER_MODULE_EXPORT
#endif

/// Define the factory a driver library exports. `ModuleType` must be a
/// default-constructible DriverModule.
#define WDSERVER_DEFINE_DRIVER_MODULE(ModuleType)                                  \
    extern "C" WDSERVER_MODULE_EXPORT auto wdserver_create_driver_module()         \
        -> std::unique_ptr<::wdserver::drivers::DriverModule> {                    \
        return std::make_unique<ModuleType>();                                     \
    }
