#include "infrastructure/mcp/McpJson.hpp"

#include <chrono>
#include <ctime>
#include <string>

#include "domain/Errors.hpp"

using nlohmann::json;

namespace sentinel::discovery::infrastructure::mcp::json_map
{

namespace
{
std::string str_or_empty(const json& obj, const char* key)
{
  if (!obj.is_object()) return {};
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

// Present and either an object (MCP style) or literal true.
bool flag(const json& caps, const char* key)
{
  auto it = caps.find(key);
  if (it == caps.end()) return false;
  if (it->is_object()) return true;
  return it->is_boolean() && it->get<bool>();
}

const json& array_field(const json& result, const char* key)
{
  if (!result.is_object()) throw domain::ProtocolMismatchError("result is not an object");
  auto it = result.find(key);
  if (it == result.end() || !it->is_array())
    throw domain::ProtocolMismatchError(std::string("result has no '") + key + "' array");
  return *it;
}

std::string iso8601(std::chrono::system_clock::time_point tp)
{
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}
}  // namespace

domain::Capabilities parse_capabilities(const json& caps)
{
  domain::Capabilities c;
  if (!caps.is_object()) return c;
  c.tools = flag(caps, "tools");
  c.resources = flag(caps, "resources");
  c.prompts = flag(caps, "prompts");
  return c;
}

domain::ServerIdentity parse_identity(const json& result)
{
  if (!result.is_object()) throw domain::ProtocolMismatchError("initialize result is not an object");

  const auto si = result.find("serverInfo");
  const json& info = (si != result.end() && si->is_object()) ? *si : result;

  domain::ServerIdentity id;
  id.name = str_or_empty(info, "name");
  if (id.name.empty()) throw domain::ProtocolMismatchError("initialize result carries no server name");

  id.version = str_or_empty(info, "version");
  id.description = str_or_empty(info, "description");
  if (id.description.empty()) id.description = str_or_empty(result, "description");
  if (id.description.empty()) id.description = str_or_empty(result, "instructions");
  id.protocolVersion = str_or_empty(result, "protocolVersion");

  if (auto caps = result.find("capabilities"); caps != result.end())
    id.capabilities = parse_capabilities(*caps);
  return id;
}

std::vector<domain::Tool> parse_tools(const json& result)
{
  std::vector<domain::Tool> out;
  for (const auto& t : array_field(result, "tools"))
  {
    domain::Tool tool;
    tool.name = str_or_empty(t, "name");
    if (tool.name.empty()) continue;
    tool.description = str_or_empty(t, "description");
    auto schema = t.find("inputSchema");
    tool.inputSchema = (schema != t.end()) ? schema->dump() : "{}";
    out.push_back(std::move(tool));
  }
  return out;
}

std::vector<domain::Resource> parse_resources(const json& result)
{
  std::vector<domain::Resource> out;
  for (const auto& r : array_field(result, "resources"))
  {
    domain::Resource res;
    res.uri = str_or_empty(r, "uri");
    if (res.uri.empty()) continue;
    res.name = str_or_empty(r, "name");
    res.description = str_or_empty(r, "description");
    res.mimeType = str_or_empty(r, "mimeType");
    out.push_back(std::move(res));
  }
  return out;
}

std::vector<domain::Prompt> parse_prompts(const json& result)
{
  std::vector<domain::Prompt> out;
  for (const auto& p : array_field(result, "prompts"))
  {
    domain::Prompt prompt;
    prompt.name = str_or_empty(p, "name");
    if (prompt.name.empty()) continue;
    prompt.description = str_or_empty(p, "description");
    if (auto args = p.find("arguments"); args != p.end() && args->is_array())
    {
      for (const auto& a : *args)
      {
        domain::PromptArgument arg;
        arg.name = str_or_empty(a, "name");
        arg.description = str_or_empty(a, "description");
        if (auto req = a.find("required"); req != a.end() && req->is_boolean())
          arg.required = req->get<bool>();
        prompt.arguments.push_back(std::move(arg));
      }
    }
    out.push_back(std::move(prompt));
  }
  return out;
}

json to_json(const domain::DiscoveredServer& s)
{
  json tools = json::array();
  for (const auto& t : s.tools)
  {
    json schema = json::parse(t.inputSchema, nullptr, false);
    if (schema.is_discarded()) schema = json::object();
    tools.push_back({{"name", t.name}, {"description", t.description}, {"inputSchema", schema}});
  }

  json resources = json::array();
  for (const auto& r : s.resources)
    resources.push_back({{"uri", r.uri},
                         {"name", r.name},
                         {"description", r.description},
                         {"mimeType", r.mimeType}});

  json prompts = json::array();
  for (const auto& p : s.prompts)
  {
    json args = json::array();
    for (const auto& a : p.arguments)
      args.push_back({{"name", a.name}, {"description", a.description}, {"required", a.required}});
    prompts.push_back({{"name", p.name}, {"description", p.description}, {"arguments", args}});
  }

  return json{{"url", s.url},
              {"name", s.name},
              {"version", s.version},
              {"description", s.description},
              {"capabilities",
               {{"tools", s.capabilities.tools},
                {"resources", s.capabilities.resources},
                {"prompts", s.capabilities.prompts}}},
              {"tools", tools},
              {"resources", resources},
              {"prompts", prompts},
              {"status", s.status},
              {"last_seen", iso8601(s.lastSeen)},
              {"response_time_ms", s.responseTime.count()},
              {"metadata", s.metadata}};
}

json to_json(const std::vector<domain::DiscoveredServer>& servers)
{
  json out = json::array();
  for (const auto& s : servers) out.push_back(to_json(s));
  return out;
}

}  // namespace sentinel::discovery::infrastructure::mcp::json_map
