#pragma once

#include "talekeeper/config/schema.hpp"
#include "talekeeper/sessions/session.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace talekeeper::context {

/// Cost of a piece of rendered text in budget units. Must not depend on anything but the text.
using SizeEstimator = std::function<std::size_t(std::string_view)>;

/// ceil(chars / chars_per_unit); a zero divisor is treated as 1.
[[nodiscard]] SizeEstimator estimate_by_chars(std::size_t chars_per_unit = 4);
/// Whitespace-separated word count.
[[nodiscard]] SizeEstimator estimate_by_words();

struct TokenBudget {
  std::size_t limit = 4000;
};

enum class SectionLayer {
  Summary,
  RecentScene,
  CurrentScene,
};

[[nodiscard]] std::string section_layer_to_string(SectionLayer layer);

enum class EntryKind {
  Event,
  Summary,
};

struct ContextEntry {
  EntryKind kind = EntryKind::Event;
  std::string event_id;
  std::string text;
  std::size_t cost = 0;
};

struct ContextSection {
  SectionLayer layer = SectionLayer::CurrentScene;
  std::string scene_id;
  std::string title;
  std::string location;
  /// Cost of the section heading, already counted in ContextPackage::consumed.
  std::size_t header_cost = 0;
  std::vector<ContextEntry> entries;
};

struct ContextPackage {
  std::string session_id;
  /// Chronological: summaries, then recent scenes, then the current scene.
  std::vector<ContextSection> sections;
  std::size_t consumed = 0;
  std::size_t budget = 0;
  bool over_budget = false;
};

struct AssemblerOptions {
  std::size_t recent_scene_window = 2;
  SizeEstimator estimator = estimate_by_chars(4);
};

[[nodiscard]] AssemblerOptions options_from_config(const config::ContextConfig &config);

class ContextAssembler {
public:
  explicit ContextAssembler(AssemblerOptions options = {});

  [[nodiscard]] ContextPackage build(const sessions::Session &session, TokenBudget budget) const;

  [[nodiscard]] const AssemblerOptions &options() const { return options_; }

private:
  [[nodiscard]] ContextSection scene_section(const sessions::Scene &scene,
                                             SectionLayer layer) const;
  [[nodiscard]] std::size_t section_cost(const ContextSection &section) const;

  AssemblerOptions options_;
};

/// "[actor] text" for an event, "text" when it has no actor.
[[nodiscard]] std::string render_event_line(const sessions::Event &event);

/// Text block handed to the generator.
[[nodiscard]] std::string render_context(const ContextPackage &package);

} // namespace talekeeper::context
