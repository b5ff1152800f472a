#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "application/ports/IMcpTransport.hpp"
#include "infrastructure/http/HttpClient_Beast.hpp"

namespace sentinel::discovery::infrastructure::mcp
{

// JSON-RPC 2.0 over HTTP POST to the server URL. Plain JSON and
// single-event text/event-stream replies are both understood.
class McpTransport_Http final : public sentinel::discovery::application::ports::IMcpTransport
{
 public:
  explicit McpTransport_Http(sentinel::discovery::application::ports::ILogger& log) : log_(log) {}

  domain::ServerIdentity initialize(const std::string& url, Deadline deadline) override;
  std::vector<domain::Tool> list_tools(const std::string& url, Deadline deadline) override;
  std::vector<domain::Resource> list_resources(const std::string& url, Deadline deadline) override;
  std::vector<domain::Prompt> list_prompts(const std::string& url, Deadline deadline) override;

  // Extracts the JSON-RPC payload from a reply body. Throws domain::ProtocolMismatchError.
  static nlohmann::json decode_body(const http::HttpResponse& res);

 private:
  // Returns the "result" member of the reply.
  nlohmann::json call(const std::string& url, std::string_view method, int id,
                      const nlohmann::json& params, Deadline deadline) const;

  void notify(const std::string& url, std::string_view method, Deadline deadline) const;

  sentinel::discovery::application::ports::ILogger& log_;
  http::HttpClient_Beast http_;
};

}  // namespace sentinel::discovery::infrastructure::mcp
