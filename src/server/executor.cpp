#include "wdserver/server/executor.hpp"

#include <memory>
#include <string>

#include <boost/asio/post.hpp>

#include "wdserver/core/logger.hpp"

namespace wdserver::server {

CommandExecutor::CommandExecutor(commands::CommandRegistry& registry, std::size_t threads)
    : registry_(registry), pool_(threads == 0 ? 1 : threads) {
    LOG_DEBUG("Command executor started with {} thread(s)", threads == 0 ? 1 : threads);
}

CommandExecutor::~CommandExecutor() {
    shutdown();
}

auto CommandExecutor::run(commands::Command command,
                          const LocatorParameters& locator,
                          const BodyParameters& body) -> Result<json> {
    auto handler = registry_.create(command, locator, body);
    if (!handler) {
        LOG_WARN("Rejected '{}': {}", commands::to_string(command), handler.error().what());
        return std::unexpected(handler.error());
    }

    auto label = (*handler)->describe();
    LOG_DEBUG("Executing {}", label);

    auto result = (*handler)->execute();
    if (!result) {
        LOG_WARN("{} failed: [{}] {}", label,
                 error_code_to_string(result.error().code()), result.error().what());
    }
    return result;
}

auto CommandExecutor::submit(commands::Command command,
                             LocatorParameters locator,
                             BodyParameters body) -> std::future<Result<json>> {
    auto task = std::make_shared<std::packaged_task<Result<json>()>>(
        [this, command, locator = std::move(locator), body = std::move(body)] {
            return run(command, locator, body);
        });
    auto future = task->get_future();

    std::lock_guard lock(state_mutex_);
    if (stopped_) {
        LOG_WARN("Rejected '{}': executor is shut down", commands::to_string(command));
        std::promise<Result<json>> rejected;
        rejected.set_value(std::unexpected(make_error(
            ErrorCode::InternalError, "Command executor is shut down",
            std::string(commands::to_string(command)))));
        return rejected.get_future();
    }
    boost::asio::post(pool_, [task] { (*task)(); });
    return future;
}

void CommandExecutor::shutdown() {
    {
        std::lock_guard lock(state_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    pool_.join();
    LOG_DEBUG("Command executor stopped");
}

} // namespace wdserver::server
