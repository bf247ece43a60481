#pragma once

#include <cstddef>
#include <future>
#include <mutex>

#include <boost/asio/thread_pool.hpp>

#include "wdserver/commands/command.hpp"
#include "wdserver/commands/registry.hpp"
#include "wdserver/core/error.hpp"
#include "wdserver/core/types.hpp"

namespace wdserver::server {

/// Runs protocol commands on a worker pool.
///
/// Commands for different sessions run in parallel; commands for the same
/// session are serialized by the session's execution lock. There is no
/// cancellation: a submitted command runs to completion or failure.
class CommandExecutor {
public:
    CommandExecutor(commands::CommandRegistry& registry, std::size_t threads);
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /// Create and execute the handler for `command` on the calling thread.
    auto run(commands::Command command,
             const LocatorParameters& locator,
             const BodyParameters& body) -> Result<json>;

    /// Queue `command` on the pool. After shutdown the returned future is
    /// already ready and holds an InternalError.
    auto submit(commands::Command command,
                LocatorParameters locator,
                BodyParameters body) -> std::future<Result<json>>;

    /// Wait for queued and in-flight commands, then stop the pool.
    void shutdown();

private:
    commands::CommandRegistry& registry_;
    boost::asio::thread_pool pool_;
    std::mutex state_mutex_;
    bool stopped_ = false;
};

} // namespace wdserver::server
