#pragma once

#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace wdserver {

using json = nlohmann::json;

/// Parameters extracted from the request path (session id, element id, ...).
using LocatorParameters = std::unordered_map<std::string, std::string>;

/// Parameters extracted from the request payload. Always a JSON object;
/// a null body is treated as an empty object.
using BodyParameters = json;

/// Capability set requested for, or advertised by, a driver.
using Capabilities = json;

/// Locator parameter key carrying the session identifier.
inline constexpr const char* kSessionIdKey = "sessionId";

} // namespace wdserver
