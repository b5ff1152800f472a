#pragma once

#include <string_view>

namespace sentinel::discovery::domain::protocol
{

inline constexpr std::string_view kJsonRpcVersion = "2.0";
inline constexpr std::string_view kProtocolVersion = "2024-11-05";

inline constexpr std::string_view kClientName = "Sentinel Discovery";
inline constexpr std::string_view kClientVersion = "1.0.0";
inline constexpr std::string_view kUserAgent = "Sentinel-Discovery/1.0.0";

// ---- Methods ----
namespace method
{
inline constexpr std::string_view initialize = "initialize";
inline constexpr std::string_view initialized = "notifications/initialized";
inline constexpr std::string_view tools_list = "tools/list";
inline constexpr std::string_view resources_list = "resources/list";
inline constexpr std::string_view prompts_list = "prompts/list";
}  // namespace method

// Fixed request ids per method, so a reply can be matched without session state.
namespace request_id
{
inline constexpr int initialize = 1;
inline constexpr int tools_list = 2;
inline constexpr int resources_list = 3;
inline constexpr int prompts_list = 4;
}  // namespace request_id

// Capability categories, as they appear in logs and errors.
namespace category
{
inline constexpr std::string_view tools = "tools";
inline constexpr std::string_view resources = "resources";
inline constexpr std::string_view prompts = "prompts";
}  // namespace category

}  // namespace sentinel::discovery::domain::protocol
