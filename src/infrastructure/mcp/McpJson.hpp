#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "domain/DiscoveredServer.hpp"

namespace sentinel::discovery::infrastructure::mcp
{

// Wire <-> domain mapping for MCP results. Parsers throw
// domain::ProtocolMismatchError when the shape is not what the method promises.
namespace json_map
{

// Accepts {serverInfo:{name,version}, capabilities, instructions, protocolVersion}
// as well as the flat {name, version, description, capabilities}.
domain::ServerIdentity parse_identity(const nlohmann::json& result);

domain::Capabilities parse_capabilities(const nlohmann::json& caps);

std::vector<domain::Tool> parse_tools(const nlohmann::json& result);
std::vector<domain::Resource> parse_resources(const nlohmann::json& result);
std::vector<domain::Prompt> parse_prompts(const nlohmann::json& result);

nlohmann::json to_json(const domain::DiscoveredServer& s);
nlohmann::json to_json(const std::vector<domain::DiscoveredServer>& servers);

}  // namespace json_map

}  // namespace sentinel::discovery::infrastructure::mcp
