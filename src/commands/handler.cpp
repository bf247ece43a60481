#include "wdserver/commands/handler.hpp"

#include <cstdint>
#include <limits>

#include "wdserver/core/logger.hpp"

namespace wdserver::commands {

namespace {

auto construction_error(std::string message, std::string_view key) -> Error {
    return make_error(ErrorCode::HandlerConstructionFailed, std::move(message), std::string(key));
}

auto find_parameter(const BodyParameters& body, std::string_view key) -> const json* {
    if (!body.is_object()) return nullptr;
    auto it = body.find(std::string(key));
    if (it == body.end() || it->is_null()) return nullptr;
    return &*it;
}

} // anonymous namespace

CommandHandler::CommandHandler(const HandlerContext& context)
    : sessions_(context.sessions), locator_(context.locator) {}

auto CommandHandler::resolve_session() const -> Result<std::shared_ptr<sessions::Session>> {
    auto it = locator_.find(kSessionIdKey);
    if (it == locator_.end() || it->second.empty()) {
        return std::unexpected(make_error(
            ErrorCode::SessionNotFound,
            "No session id in request"));
    }

    auto session = sessions_.get_session(it->second);
    if (!session) {
        return std::unexpected(make_error(
            ErrorCode::SessionNotFound,
            "Session not found",
            it->second));
    }
    return session;
}

auto SessionCommandHandler::execute() -> Result<json> {
    auto session = resolve_session();
    if (!session) {
        return std::unexpected(session.error());
    }

    LOG_DEBUG("Executing {} on session {}", describe(), (*session)->id());
    return (*session)->with_driver([this](drivers::Driver& driver) {
        return execute_with(driver);
    });
}

UnsupportedCommandHandler::UnsupportedCommandHandler(Command command,
                                                     const HandlerContext& context)
    : CommandHandler(context), command_(command) {}

auto UnsupportedCommandHandler::execute() -> Result<json> {
    return std::unexpected(make_error(
        ErrorCode::UnsupportedCommand,
        "Command not supported",
        std::string(to_string(command_))));
}

auto UnsupportedCommandHandler::describe() const -> std::string {
    return "[unsupported command: " + std::string(to_string(command_)) + "]";
}

auto require_string(const BodyParameters& body, std::string_view key) -> Result<std::string> {
    const auto* value = find_parameter(body, key);
    if (!value) {
        return std::unexpected(construction_error("Missing required parameter", key));
    }
    if (!value->is_string()) {
        return std::unexpected(construction_error("Parameter must be a string", key));
    }
    return value->get<std::string>();
}

auto require_object(const BodyParameters& body, std::string_view key) -> Result<json> {
    const auto* value = find_parameter(body, key);
    if (!value) {
        return std::unexpected(construction_error("Missing required parameter", key));
    }
    if (!value->is_object()) {
        return std::unexpected(construction_error("Parameter must be an object", key));
    }
    return *value;
}

auto optional_int(const BodyParameters& body, std::string_view key, int fallback) -> Result<int> {
    const auto* value = find_parameter(body, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number_integer()) {
        return std::unexpected(construction_error("Parameter must be an integer", key));
    }

    // Unsigned values above INT64_MAX would wrap negative through get<int64_t>.
    if (value->is_number_unsigned() &&
        value->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(construction_error("Parameter out of range", key));
    }

    auto number = value->get<int64_t>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        return std::unexpected(construction_error("Parameter out of range", key));
    }
    return static_cast<int>(number);
}

} // namespace wdserver::commands
