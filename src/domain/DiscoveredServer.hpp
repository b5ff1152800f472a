#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace sentinel::discovery::domain
{

struct Capabilities
{
  bool tools{false};
  bool resources{false};
  bool prompts{false};
};

struct Tool
{
  std::string name;
  std::string description;
  std::string inputSchema;  // raw JSON text, kept opaque
};

struct Resource
{
  std::string uri;
  std::string name;
  std::string description;
  std::string mimeType;
};

struct PromptArgument
{
  std::string name;
  std::string description;
  bool required{false};
};

struct Prompt
{
  std::string name;
  std::string description;
  std::vector<PromptArgument> arguments;
};

// Result of a successful initialize exchange.
struct ServerIdentity
{
  std::string name;
  std::string version;
  std::string description;
  std::string protocolVersion;
  Capabilities capabilities;
};

struct DiscoveredServer
{
  std::string url;  // unique key
  std::string name;
  std::string version;
  std::string description;
  Capabilities capabilities;
  std::vector<Tool> tools;
  std::vector<Resource> resources;
  std::vector<Prompt> prompts;
  std::string status{"online"};
  std::chrono::system_clock::time_point lastSeen{};
  std::chrono::milliseconds responseTime{0};
  std::map<std::string, std::string> metadata;
};

}  // namespace sentinel::discovery::domain
