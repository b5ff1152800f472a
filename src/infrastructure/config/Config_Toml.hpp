#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace sentinel::discovery::infrastructure::config
{

// sentinel-discovery.toml with [logging], [discovery] and [periodic] sections.
class Config_Toml : public sentinel::discovery::application::ports::IConfigProvider
{
 public:
  sentinel::discovery::domain::Settings load_or_create(const std::string& path) override;

  // [start, end] intersected with 1-65535; empty when reversed or disjoint.
  static std::optional<std::pair<int, int>> normalize_port_range(int64_t start, int64_t end);

 private:
  static void write_default(const boost::filesystem::path& path,
                            sentinel::discovery::domain::Settings& s);
};

}  // namespace sentinel::discovery::infrastructure::config
