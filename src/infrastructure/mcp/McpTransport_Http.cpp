#include "infrastructure/mcp/McpTransport_Http.hpp"

#include <sstream>

#include "domain/Errors.hpp"
#include "domain/protocol/McpMethods.hpp"
#include "infrastructure/mcp/McpJson.hpp"
#include "shared/hex/Hex.hpp"

using nlohmann::json;
using sentinel::discovery::application::ports::LogLevel;
namespace proto = sentinel::discovery::domain::protocol;
namespace bhttp = boost::beast::http;

namespace sentinel::discovery::infrastructure::mcp
{

namespace
{
// First "data:" payload of an SSE stream; enough for a single JSON-RPC reply.
std::string first_sse_data(const std::string& body)
{
  std::istringstream in(body);
  std::string line, data;
  while (std::getline(in, line))
  {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.rfind("data:", 0) == 0)
    {
      auto chunk = line.substr(5);
      if (!chunk.empty() && chunk.front() == ' ') chunk.erase(0, 1);
      data += chunk;
    }
    else if (line.empty() && !data.empty())
    {
      break;
    }
  }
  return data;
}
}  // namespace

json McpTransport_Http::decode_body(const http::HttpResponse& res)
{
  const bool sse = res.contentType.find("text/event-stream") != std::string::npos;
  const std::string payload = sse ? first_sse_data(res.body) : res.body;

  json doc = json::parse(payload, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    throw domain::ProtocolMismatchError(shared::hex::make_line("reply is not a JSON object", payload));
  return doc;
}

json McpTransport_Http::call(const std::string& url, std::string_view method, int id,
                             const json& params, Deadline deadline) const
{
  json req{{"jsonrpc", std::string(proto::kJsonRpcVersion)},
           {"id", id},
           {"method", std::string(method)}};
  if (!params.is_null()) req["params"] = params;

  const std::string body = req.dump();
  log_.probe(LogLevel::trace, "Sending " + std::string(method) + " to " + url + ": " + body);

  const auto res = http_.request(bhttp::verb::post, url, body, deadline);
  if (res.status != 200)
    throw domain::ProtocolMismatchError(std::string(method) + " answered HTTP " +
                                        std::to_string(res.status));

  log_.probe(LogLevel::trace, "Received " + std::string(method) + " from " + url + ": " +
                                  std::to_string(res.body.size()) + " bytes");

  const json doc = decode_body(res);

  if (auto err = doc.find("error"); err != doc.end() && !err->is_null())
  {
    std::string msg = "unknown error";
    if (err->is_object() && err->contains("message") && (*err)["message"].is_string())
      msg = (*err)["message"].get<std::string>();
    throw domain::ProtocolMismatchError(std::string(method) + " returned error: " + msg);
  }

  auto result = doc.find("result");
  if (result == doc.end())
    throw domain::ProtocolMismatchError(std::string(method) + " reply has no result");
  return *result;
}

void McpTransport_Http::notify(const std::string& url, std::string_view method,
                               Deadline deadline) const
{
  const json note{{"jsonrpc", std::string(proto::kJsonRpcVersion)},
                  {"method", std::string(method)}};
  const auto res = http_.request(bhttp::verb::post, url, note.dump(), deadline);
  if (res.status >= 300)
    throw domain::ProtocolMismatchError(std::string(method) + " answered HTTP " +
                                        std::to_string(res.status));
}

domain::ServerIdentity McpTransport_Http::initialize(const std::string& url, Deadline deadline)
{
  const json params{
      {"protocolVersion", std::string(proto::kProtocolVersion)},
      {"capabilities", {{"roots", {{"listChanged", true}}}, {"sampling", json::object()}}},
      {"clientInfo",
       {{"name", std::string(proto::kClientName)},
        {"version", std::string(proto::kClientVersion)}}}};

  const json result =
      call(url, proto::method::initialize, proto::request_id::initialize, params, deadline);
  auto identity = json_map::parse_identity(result);

  try
  {
    notify(url, proto::method::initialized, deadline);
  }
  catch (const domain::DiscoveryError& e)
  {
    log_.probe(LogLevel::warn, "Failed to send initialized notification to " + url + ": " +
                                   e.what());
  }

  return identity;
}

std::vector<domain::Tool> McpTransport_Http::list_tools(const std::string& url, Deadline deadline)
{
  return json_map::parse_tools(
      call(url, proto::method::tools_list, proto::request_id::tools_list, json{}, deadline));
}

std::vector<domain::Resource> McpTransport_Http::list_resources(const std::string& url,
                                                                Deadline deadline)
{
  return json_map::parse_resources(call(url, proto::method::resources_list,
                                        proto::request_id::resources_list, json{}, deadline));
}

std::vector<domain::Prompt> McpTransport_Http::list_prompts(const std::string& url,
                                                            Deadline deadline)
{
  return json_map::parse_prompts(
      call(url, proto::method::prompts_list, proto::request_id::prompts_list, json{}, deadline));
}

}  // namespace sentinel::discovery::infrastructure::mcp
