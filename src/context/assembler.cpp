#include "talekeeper/context/assembler.hpp"

#include "talekeeper/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace talekeeper::context {

namespace {

constexpr const char *kEarlierEventsHeading = "## Earlier Events";

std::string display_title(const sessions::Scene &scene) {
  return scene.title.empty() ? scene.id : scene.title;
}

std::string scene_heading(const ContextSection &section) {
  std::string heading = "## " + section.title;
  if (!section.location.empty()) {
    heading += "\nLocation: " + section.location;
  }
  return heading;
}

} // namespace

SizeEstimator estimate_by_chars(std::size_t chars_per_unit) {
  if (chars_per_unit == 0) {
    chars_per_unit = 1;
  }
  return [chars_per_unit](const std::string_view text) {
    return (text.size() + chars_per_unit - 1) / chars_per_unit;
  };
}

SizeEstimator estimate_by_words() {
  return [](const std::string_view text) {
    std::size_t words = 0;
    bool in_word = false;
    for (const char ch : text) {
      if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
        in_word = false;
      } else if (!in_word) {
        in_word = true;
        ++words;
      }
    }
    return words;
  };
}

std::string section_layer_to_string(const SectionLayer layer) {
  switch (layer) {
  case SectionLayer::Summary:
    return "summary";
  case SectionLayer::RecentScene:
    return "recent_scene";
  case SectionLayer::CurrentScene:
    return "current_scene";
  }
  return "current_scene";
}

AssemblerOptions options_from_config(const config::ContextConfig &config) {
  AssemblerOptions options;
  options.recent_scene_window = static_cast<std::size_t>(config.recent_scene_window);
  options.estimator = estimate_by_chars(static_cast<std::size_t>(config.chars_per_token));
  return options;
}

std::string render_event_line(const sessions::Event &event) {
  const std::string body = sessions::payload_text(event.payload);
  if (event.actor.has_value()) {
    return "[" + *event.actor + "] " + body;
  }
  return body;
}

ContextAssembler::ContextAssembler(AssemblerOptions options) : options_(std::move(options)) {
  if (!options_.estimator) {
    options_.estimator = estimate_by_chars(4);
  }
}

ContextSection ContextAssembler::scene_section(const sessions::Scene &scene,
                                               const SectionLayer layer) const {
  ContextSection section;
  section.layer = layer;
  section.scene_id = scene.id;
  section.title = display_title(scene);
  section.location = scene.location;
  section.header_cost = options_.estimator(scene_heading(section));
  section.entries.reserve(scene.events.size());
  for (const auto &event : scene.events) {
    ContextEntry entry;
    entry.kind = EntryKind::Event;
    entry.event_id = event.id;
    entry.text = render_event_line(event);
    entry.cost = options_.estimator(entry.text);
    section.entries.push_back(std::move(entry));
  }
  return section;
}

std::size_t ContextAssembler::section_cost(const ContextSection &section) const {
  std::size_t cost = section.header_cost;
  for (const auto &entry : section.entries) {
    cost += entry.cost;
  }
  return cost;
}

ContextPackage ContextAssembler::build(const sessions::Session &session,
                                       const TokenBudget budget) const {
  ContextPackage package;
  package.session_id = session.id();
  package.budget = budget.limit;

  const auto &scenes = session.scenes();
  const auto active_index = session.active_scene_index();

  // Layer 1: the current scene is never trimmed.
  std::optional<ContextSection> current;
  if (active_index.has_value()) {
    current = scene_section(scenes[*active_index], SectionLayer::CurrentScene);
    package.consumed += section_cost(*current);
    if (package.consumed > budget.limit) {
      package.over_budget = true;
      observability::record_budget_warning(session.id(), package.consumed, budget.limit);
    }
  }

  // Layer 2: whole ended scenes, newest first, until the window or the budget runs out.
  std::vector<ContextSection> recent;
  std::size_t older_than = scenes.size();
  for (std::size_t i = scenes.size(); i-- > 0;) {
    if (active_index == i || scenes[i].active) {
      continue;
    }
    if (recent.size() >= options_.recent_scene_window) {
      break;
    }
    ContextSection section = scene_section(scenes[i], SectionLayer::RecentScene);
    const std::size_t cost = section_cost(section);
    if (package.consumed + cost > budget.limit) {
      break;
    }
    package.consumed += cost;
    recent.push_back(std::move(section));
    older_than = i;
  }

  // Layer 3: summaries of everything older than the oldest raw scene.
  std::vector<ContextSection> summaries;
  const std::size_t heading_cost = options_.estimator(kEarlierEventsHeading);
  for (std::size_t i = older_than; i-- > 0;) {
    const auto &scene = scenes[i];
    if (scene.active || !scene.summary.has_value()) {
      continue;
    }
    ContextSection section;
    section.layer = SectionLayer::Summary;
    section.scene_id = scene.id;
    section.title = display_title(scene);
    section.location = scene.location;

    ContextEntry entry;
    entry.kind = EntryKind::Summary;
    entry.text = "**" + section.title + "**: " + *scene.summary;
    entry.cost = options_.estimator(entry.text);

    const std::size_t cost = entry.cost + (summaries.empty() ? heading_cost : 0);
    if (package.consumed + cost > budget.limit) {
      break;
    }
    package.consumed += cost;
    section.entries.push_back(std::move(entry));
    summaries.push_back(std::move(section));
  }
  std::reverse(summaries.begin(), summaries.end());
  if (!summaries.empty()) {
    summaries.front().header_cost = heading_cost;
  }
  std::reverse(recent.begin(), recent.end());

  package.sections.reserve(summaries.size() + recent.size() + 1);
  for (auto &section : summaries) {
    package.sections.push_back(std::move(section));
  }
  for (auto &section : recent) {
    package.sections.push_back(std::move(section));
  }
  if (current.has_value()) {
    package.sections.push_back(std::move(*current));
  }

  observability::record_context_built(session.id(), package.sections.size(), package.consumed,
                                      budget.limit);
  return package;
}

std::string render_context(const ContextPackage &package) {
  std::ostringstream out;
  bool wrote_block = false;
  bool in_summaries = false;
  for (const auto &section : package.sections) {
    if (section.layer == SectionLayer::Summary) {
      if (!in_summaries) {
        out << kEarlierEventsHeading << "\n";
        in_summaries = true;
        wrote_block = true;
      }
      for (const auto &entry : section.entries) {
        out << entry.text << "\n";
      }
      continue;
    }
    if (wrote_block) {
      out << "\n";
    }
    in_summaries = false;
    wrote_block = true;
    out << scene_heading(section) << "\n";
    for (const auto &entry : section.entries) {
      out << entry.text << "\n";
    }
  }
  return out.str();
}

} // namespace talekeeper::context
