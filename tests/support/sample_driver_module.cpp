// Driver library loaded at runtime by the module loader tests. Built as
// SampleDrivers.so in the test driver library directory.

#include <memory>
#include <string_view>
#include <vector>

#include "support/fake_driver.hpp"
#include "wdserver/export.hpp"

namespace {

class SampleDriver : public wdserver::testing::FakeDriver {};

class SampleWidget {};

class SampleDriversModule : public wdserver::drivers::DriverModule {
public:
    SampleDriversModule()
        : types_{
              wdserver::drivers::make_backend_type<SampleDriver>("SampleDriver"),
              wdserver::drivers::make_backend_type<SampleWidget>("SampleWidget"),
          } {}

    [[nodiscard]] auto name() const -> std::string_view override { return "SampleDrivers"; }
    [[nodiscard]] auto version() const -> std::string_view override { return "0.3.0"; }
    [[nodiscard]] auto types() const -> const std::vector<wdserver::drivers::BackendType>& override {
        return types_;
    }

private:
    std::vector<wdserver::drivers::BackendType> types_;
};

} // anonymous namespace

WDSERVER_DEFINE_DRIVER_MODULE(SampleDriversModule)
