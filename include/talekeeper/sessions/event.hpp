#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/dice/roller.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace talekeeper::sessions {

enum class EventType {
  Narration,
  PlayerAction,
  DiceRoll,
  NpcAction,
  NpcDialogue,
  System,
  ToolCall,
  StateChange,
};

[[nodiscard]] std::string event_type_to_string(EventType type);
[[nodiscard]] std::optional<EventType> event_type_from_string(std::string_view value);

struct NarrationPayload {
  std::string text;
  bool operator==(const NarrationPayload &) const = default;
};

struct PlayerActionPayload {
  std::string text;
  bool operator==(const PlayerActionPayload &) const = default;
};

struct DiceRollPayload {
  std::string notation;
  std::int64_t total = 0;
  std::vector<int> rolls;
  std::vector<int> kept;
  std::string detail;
  bool operator==(const DiceRollPayload &) const = default;
};

struct NpcActionPayload {
  std::string text;
  bool operator==(const NpcActionPayload &) const = default;
};

struct NpcDialoguePayload {
  std::string text;
  bool operator==(const NpcDialoguePayload &) const = default;
};

struct SystemPayload {
  std::string text;
  bool operator==(const SystemPayload &) const = default;
};

struct ToolCallPayload {
  std::string tool;
  /// JSON text, stored verbatim.
  std::string arguments;
  std::string result;
  bool operator==(const ToolCallPayload &) const = default;
};

struct StateChangePayload {
  std::string key;
  std::optional<std::string> previous;
  std::string value;
  bool operator==(const StateChangePayload &) const = default;
};

using EventPayload =
    std::variant<NarrationPayload, PlayerActionPayload, DiceRollPayload, NpcActionPayload,
                 NpcDialoguePayload, SystemPayload, ToolCallPayload, StateChangePayload>;

using EventMetadata = std::map<std::string, std::string>;

struct Event {
  std::string id;
  std::string timestamp;
  std::optional<std::string> actor;
  EventPayload payload;
  EventMetadata metadata;
  /// Payload members this build does not know, as raw JSON text, kept for re-encoding.
  std::map<std::string, std::string> extensions;

  [[nodiscard]] EventType type() const;
  bool operator==(const Event &) const = default;
};

[[nodiscard]] EventType payload_type(const EventPayload &payload);

/// Payload for one of the text-bodied types (narration, player_action, npc_action,
/// npc_dialogue, system). InvalidArgument for the structured types.
[[nodiscard]] common::Result<EventPayload> make_text_payload(EventType type, std::string text);

[[nodiscard]] DiceRollPayload make_dice_roll_payload(const dice::RollResult &result);

/// Single-line rendering of the payload body, used by context assembly and the CLI.
[[nodiscard]] std::string payload_text(const EventPayload &payload);

} // namespace talekeeper::sessions
