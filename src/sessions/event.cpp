#include "talekeeper/sessions/event.hpp"

#include "talekeeper/common/fs.hpp"

#include <type_traits>

namespace talekeeper::sessions {

std::string event_type_to_string(const EventType type) {
  switch (type) {
  case EventType::Narration:
    return "narration";
  case EventType::PlayerAction:
    return "player_action";
  case EventType::DiceRoll:
    return "dice_roll";
  case EventType::NpcAction:
    return "npc_action";
  case EventType::NpcDialogue:
    return "npc_dialogue";
  case EventType::System:
    return "system";
  case EventType::ToolCall:
    return "tool_call";
  case EventType::StateChange:
    return "state_change";
  }
  return "system";
}

std::optional<EventType> event_type_from_string(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "narration") {
    return EventType::Narration;
  }
  if (normalized == "player_action") {
    return EventType::PlayerAction;
  }
  if (normalized == "dice_roll") {
    return EventType::DiceRoll;
  }
  if (normalized == "npc_action") {
    return EventType::NpcAction;
  }
  if (normalized == "npc_dialogue") {
    return EventType::NpcDialogue;
  }
  if (normalized == "system") {
    return EventType::System;
  }
  if (normalized == "tool_call") {
    return EventType::ToolCall;
  }
  if (normalized == "state_change") {
    return EventType::StateChange;
  }
  return std::nullopt;
}

EventType payload_type(const EventPayload &payload) {
  return std::visit(
      [](const auto &p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, NarrationPayload>) {
          return EventType::Narration;
        } else if constexpr (std::is_same_v<T, PlayerActionPayload>) {
          return EventType::PlayerAction;
        } else if constexpr (std::is_same_v<T, DiceRollPayload>) {
          return EventType::DiceRoll;
        } else if constexpr (std::is_same_v<T, NpcActionPayload>) {
          return EventType::NpcAction;
        } else if constexpr (std::is_same_v<T, NpcDialoguePayload>) {
          return EventType::NpcDialogue;
        } else if constexpr (std::is_same_v<T, SystemPayload>) {
          return EventType::System;
        } else if constexpr (std::is_same_v<T, ToolCallPayload>) {
          return EventType::ToolCall;
        } else {
          return EventType::StateChange;
        }
      },
      payload);
}

EventType Event::type() const { return payload_type(payload); }

common::Result<EventPayload> make_text_payload(const EventType type, std::string text) {
  using R = common::Result<EventPayload>;
  switch (type) {
  case EventType::Narration:
    return R::success(NarrationPayload{std::move(text)});
  case EventType::PlayerAction:
    return R::success(PlayerActionPayload{std::move(text)});
  case EventType::NpcAction:
    return R::success(NpcActionPayload{std::move(text)});
  case EventType::NpcDialogue:
    return R::success(NpcDialoguePayload{std::move(text)});
  case EventType::System:
    return R::success(SystemPayload{std::move(text)});
  case EventType::DiceRoll:
  case EventType::ToolCall:
  case EventType::StateChange:
    break;
  }
  return R::failure(common::ErrorCode::InvalidArgument,
                    event_type_to_string(type) + " events need a structured payload");
}

DiceRollPayload make_dice_roll_payload(const dice::RollResult &result) {
  DiceRollPayload payload;
  payload.notation = result.spec.notation.empty() ? dice::to_notation(result.spec)
                                                  : result.spec.notation;
  payload.total = result.total;
  payload.rolls = dice::all_rolls(result);
  payload.kept = dice::all_kept(result);
  payload.detail = dice::describe(result);
  return payload;
}

std::string payload_text(const EventPayload &payload) {
  return std::visit(
      [](const auto &p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, DiceRollPayload>) {
          if (!p.detail.empty()) {
            return "rolled " + p.detail;
          }
          return "rolled " + p.notation + " = " + std::to_string(p.total);
        } else if constexpr (std::is_same_v<T, ToolCallPayload>) {
          std::string out = "called " + p.tool + "(" + p.arguments + ")";
          if (!p.result.empty()) {
            out += " -> " + p.result;
          }
          return out;
        } else if constexpr (std::is_same_v<T, StateChangePayload>) {
          if (p.previous.has_value()) {
            return p.key + ": " + *p.previous + " -> " + p.value;
          }
          return p.key + " = " + p.value;
        } else {
          return p.text;
        }
      },
      payload);
}

} // namespace talekeeper::sessions
