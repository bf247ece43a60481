#include "wdserver/sessions/session.hpp"

namespace wdserver::sessions {

Session::Session(std::string id, Capabilities capabilities,
                 std::unique_ptr<drivers::Driver> driver)
    : id_(std::move(id))
    , capabilities_(std::move(capabilities))
    , driver_(std::move(driver)) {}

auto Session::is_closed() const -> bool {
    std::lock_guard lock(execution_mutex_);
    return closed_;
}

auto Session::closed_error() const -> Error {
    return make_error(ErrorCode::SessionNotFound, "Session has been closed", id_);
}

} // namespace wdserver::sessions
