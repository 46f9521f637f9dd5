#include "types.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace g2048 {

std::string to_string(Side side)
{
  switch (side)
  {
    case Side::North: return "north";
    case Side::East:  return "east";
    case Side::South: return "south";
    case Side::West:  return "west";
  }
  return "none";
}

std::optional<Side> side_from_string(const std::string& str)
{
  static const std::map<std::string, Side> Side_names {
      {"w", Side::North}, {"up", Side::North},    {"north", Side::North},
      {"d", Side::East},  {"right", Side::East},  {"east", Side::East},
      {"s", Side::South}, {"down", Side::South},  {"south", Side::South},
      {"a", Side::West},  {"left", Side::West},   {"west", Side::West},
  };

  std::string key = str;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (auto it = Side_names.find(key); it != Side_names.end())
    return it->second;
  return std::nullopt;
}

} // namespace g2048
