#pragma once

#include "talekeeper/sessions/event.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace talekeeper::sessions {

struct Scene {
  std::string id;
  std::string title;
  std::string location;
  std::set<std::string> participants;
  std::string started_at;
  std::optional<std::string> ended_at;
  std::optional<std::string> summary;
  std::vector<Event> events;
  bool active = true;

  bool operator==(const Scene &) const = default;
};

} // namespace talekeeper::sessions
