#include "talekeeper/persistence/codec.hpp"

#include "talekeeper/common/json_util.hpp"

#include <limits>
#include <sstream>
#include <type_traits>

namespace talekeeper::persistence {

namespace {

using common::JsonRawObject;
using sessions::Event;
using sessions::EventType;
using sessions::Scene;

common::Status storage_error(const std::string &message) {
  return common::Status::error(common::ErrorCode::StorageFailure, message);
}

std::string quote(const std::string &value) { return common::json_quote(value); }

std::string encode_int_array(const std::vector<int> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << values[i];
  }
  out << "]";
  return out.str();
}

std::string encode_string_map(const std::map<std::string, std::string> &values) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << quote(key) << ":" << quote(value);
  }
  out << "}";
  return out.str();
}

std::string encode_payload(const Event &event) {
  std::ostringstream out;
  out << "{";
  std::visit(
      [&out](const auto &p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, sessions::DiceRollPayload>) {
          out << "\"notation\":" << quote(p.notation) << ",\"total\":" << p.total
              << ",\"rolls\":" << encode_int_array(p.rolls)
              << ",\"kept\":" << encode_int_array(p.kept) << ",\"detail\":" << quote(p.detail);
        } else if constexpr (std::is_same_v<T, sessions::ToolCallPayload>) {
          out << "\"tool\":" << quote(p.tool) << ",\"arguments\":" << quote(p.arguments)
              << ",\"result\":" << quote(p.result);
        } else if constexpr (std::is_same_v<T, sessions::StateChangePayload>) {
          out << "\"key\":" << quote(p.key);
          if (p.previous.has_value()) {
            out << ",\"previous\":" << quote(*p.previous);
          }
          out << ",\"value\":" << quote(p.value);
        } else {
          out << "\"text\":" << quote(p.text);
        }
      },
      event.payload);
  for (const auto &[key, raw] : event.extensions) {
    out << "," << quote(key) << ":" << raw;
  }
  out << "}";
  return out.str();
}

// Removes `key` from the object and returns its raw text.
std::optional<std::string> take(JsonRawObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return std::nullopt;
  }
  std::string raw = std::move(it->second);
  object.erase(it);
  return raw;
}

common::Result<std::string> take_string(JsonRawObject &object, const std::string &key,
                                        const std::string &context) {
  const auto raw = take(object, key);
  if (!raw.has_value()) {
    return common::Result<std::string>::failure(storage_error(context + ": missing \"" + key + "\""));
  }
  auto value = common::json_string_value(*raw);
  if (!value.has_value()) {
    return common::Result<std::string>::failure(
        storage_error(context + ": \"" + key + "\" must be a string"));
  }
  return common::Result<std::string>::success(std::move(*value));
}

common::Result<std::optional<std::string>>
take_optional_string(JsonRawObject &object, const std::string &key, const std::string &context) {
  using R = common::Result<std::optional<std::string>>;
  const auto raw = take(object, key);
  if (!raw.has_value() || *raw == "null") {
    return R::success(std::nullopt);
  }
  auto value = common::json_string_value(*raw);
  if (!value.has_value()) {
    return R::failure(storage_error(context + ": \"" + key + "\" must be a string"));
  }
  return R::success(std::optional<std::string>(std::move(*value)));
}

common::Result<std::vector<int>> take_int_array(JsonRawObject &object, const std::string &key,
                                                const std::string &context) {
  using R = common::Result<std::vector<int>>;
  const auto raw = take(object, key);
  if (!raw.has_value()) {
    return R::success({});
  }
  const auto parsed = common::json_parse_int_array(*raw);
  if (!parsed.has_value()) {
    return R::failure(storage_error(context + ": \"" + key + "\" must be an integer array"));
  }
  std::vector<int> out;
  out.reserve(parsed->size());
  for (const auto value : *parsed) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
      return R::failure(storage_error(context + ": \"" + key + "\" value out of range"));
    }
    out.push_back(static_cast<int>(value));
  }
  return R::success(std::move(out));
}

common::Status decode_payload(const EventType type, const std::string &raw, Event &event) {
  const std::string context = "event " + event.id + " payload";
  auto parsed = common::json_parse_object_raw(raw);
  if (!parsed.has_value()) {
    return storage_error(context + " is not an object");
  }
  JsonRawObject object = std::move(*parsed);

  switch (type) {
  case EventType::DiceRoll: {
    sessions::DiceRollPayload payload;
    auto notation = take_string(object, "notation", context);
    if (!notation.ok()) {
      return notation.status();
    }
    payload.notation = notation.value();
    const auto total_raw = take(object, "total");
    const auto total = total_raw.has_value() ? common::json_int_value(*total_raw) : std::nullopt;
    if (!total.has_value()) {
      return storage_error(context + ": \"total\" must be an integer");
    }
    payload.total = *total;
    auto rolls = take_int_array(object, "rolls", context);
    if (!rolls.ok()) {
      return rolls.status();
    }
    payload.rolls = rolls.value();
    auto kept = take_int_array(object, "kept", context);
    if (!kept.ok()) {
      return kept.status();
    }
    payload.kept = kept.value();
    auto detail = take_optional_string(object, "detail", context);
    if (!detail.ok()) {
      return detail.status();
    }
    payload.detail = detail.value().value_or("");
    event.payload = std::move(payload);
    break;
  }
  case EventType::ToolCall: {
    sessions::ToolCallPayload payload;
    auto tool = take_string(object, "tool", context);
    if (!tool.ok()) {
      return tool.status();
    }
    payload.tool = tool.value();
    auto arguments = take_optional_string(object, "arguments", context);
    if (!arguments.ok()) {
      return arguments.status();
    }
    payload.arguments = arguments.value().value_or("");
    auto result = take_optional_string(object, "result", context);
    if (!result.ok()) {
      return result.status();
    }
    payload.result = result.value().value_or("");
    event.payload = std::move(payload);
    break;
  }
  case EventType::StateChange: {
    sessions::StateChangePayload payload;
    auto key = take_string(object, "key", context);
    if (!key.ok()) {
      return key.status();
    }
    payload.key = key.value();
    auto previous = take_optional_string(object, "previous", context);
    if (!previous.ok()) {
      return previous.status();
    }
    payload.previous = previous.value();
    auto value = take_string(object, "value", context);
    if (!value.ok()) {
      return value.status();
    }
    payload.value = value.value();
    event.payload = std::move(payload);
    break;
  }
  default: {
    auto text = take_string(object, "text", context);
    if (!text.ok()) {
      return text.status();
    }
    auto payload = sessions::make_text_payload(type, text.value());
    if (!payload.ok()) {
      return storage_error(payload.error());
    }
    event.payload = std::move(payload.value());
    break;
  }
  }

  event.extensions = std::move(object);
  return common::Status::success();
}

common::Result<Scene> decode_scene(const std::string &json) {
  using R = common::Result<Scene>;
  auto parsed = common::json_parse_object_raw(json);
  if (!parsed.has_value()) {
    return R::failure(storage_error("scene is not a JSON object"));
  }
  JsonRawObject object = std::move(*parsed);

  Scene scene;
  auto id = take_string(object, "id", "scene");
  if (!id.ok()) {
    return R::failure(id.status());
  }
  scene.id = id.value();
  const std::string context = "scene " + scene.id;

  auto title = take_optional_string(object, "title", context);
  auto location = take_optional_string(object, "location", context);
  auto started_at = take_string(object, "started_at", context);
  auto ended_at = take_optional_string(object, "ended_at", context);
  auto summary = take_optional_string(object, "summary", context);
  for (const auto *status : {&title, &location, &ended_at, &summary}) {
    if (!status->ok()) {
      return R::failure(status->status());
    }
  }
  if (!started_at.ok()) {
    return R::failure(started_at.status());
  }
  scene.title = title.value().value_or("");
  scene.location = location.value().value_or("");
  scene.started_at = started_at.value();
  scene.ended_at = ended_at.value();
  scene.summary = summary.value();

  const auto active_raw = take(object, "active");
  const auto active = active_raw.has_value() ? common::json_bool_value(*active_raw) : std::nullopt;
  if (!active.has_value()) {
    return R::failure(storage_error(context + ": \"active\" must be a boolean"));
  }
  scene.active = *active;

  if (const auto participants_raw = take(object, "participants"); participants_raw.has_value()) {
    const auto participants = common::json_parse_string_array(*participants_raw);
    if (!participants.has_value()) {
      return R::failure(storage_error(context + ": \"participants\" must be a string array"));
    }
    scene.participants.insert(participants->begin(), participants->end());
  }

  const auto events_raw = take(object, "events");
  if (events_raw.has_value()) {
    const auto events = common::json_split_top_level_objects(*events_raw);
    if (!events.has_value()) {
      return R::failure(storage_error(context + ": \"events\" must be an array of objects"));
    }
    scene.events.reserve(events->size());
    for (const auto &event_json : *events) {
      auto event = decode_event(event_json);
      if (!event.ok()) {
        return R::failure(event.status());
      }
      scene.events.push_back(std::move(event.value()));
    }
  }
  return R::success(std::move(scene));
}

} // namespace

std::string encode_event(const Event &event) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << quote(event.id) << ",";
  out << "\"timestamp\":" << quote(event.timestamp) << ",";
  out << "\"type\":" << quote(sessions::event_type_to_string(event.type()));
  if (event.actor.has_value()) {
    out << ",\"actor\":" << quote(*event.actor);
  }
  out << ",\"payload\":" << encode_payload(event);
  out << ",\"metadata\":" << encode_string_map(event.metadata);
  out << "}";
  return out.str();
}

common::Result<Event> decode_event(const std::string &json) {
  using R = common::Result<Event>;
  auto parsed = common::json_parse_object_raw(json);
  if (!parsed.has_value()) {
    return R::failure(storage_error("event is not a JSON object"));
  }
  JsonRawObject object = std::move(*parsed);

  Event event;
  auto id = take_string(object, "id", "event");
  if (!id.ok()) {
    return R::failure(id.status());
  }
  event.id = id.value();
  const std::string context = "event " + event.id;

  auto timestamp = take_string(object, "timestamp", context);
  if (!timestamp.ok()) {
    return R::failure(timestamp.status());
  }
  event.timestamp = timestamp.value();

  auto type_name = take_string(object, "type", context);
  if (!type_name.ok()) {
    return R::failure(type_name.status());
  }
  const auto type = sessions::event_type_from_string(type_name.value());
  if (!type.has_value()) {
    return R::failure(storage_error(context + ": unknown type \"" + type_name.value() + "\""));
  }

  auto actor = take_optional_string(object, "actor", context);
  if (!actor.ok()) {
    return R::failure(actor.status());
  }
  event.actor = actor.value();

  const auto payload_raw = take(object, "payload");
  if (!payload_raw.has_value()) {
    return R::failure(storage_error(context + ": missing \"payload\""));
  }
  auto payload_status = decode_payload(*type, *payload_raw, event);
  if (!payload_status.ok()) {
    return R::failure(payload_status);
  }

  if (const auto metadata_raw = take(object, "metadata"); metadata_raw.has_value()) {
    const auto metadata = common::json_parse_object_raw(*metadata_raw);
    if (!metadata.has_value()) {
      return R::failure(storage_error(context + ": \"metadata\" must be an object"));
    }
    for (const auto &[key, raw] : *metadata) {
      auto value = common::json_string_value(raw);
      if (!value.has_value()) {
        return R::failure(storage_error(context + ": metadata \"" + key + "\" must be a string"));
      }
      event.metadata[key] = std::move(*value);
    }
  }
  return R::success(std::move(event));
}

std::string encode_session(const sessions::Session &session) {
  std::ostringstream out;
  out << "{";
  out << "\"format\":" << quote(kSessionFormat) << ",";
  out << "\"version\":" << kSessionFormatVersion << ",";
  out << "\"id\":" << quote(session.id()) << ",";
  out << "\"created_at\":" << quote(session.created_at());
  if (const Scene *active = session.active_scene()) {
    out << ",\"active_scene_id\":" << quote(active->id);
  }
  out << ",\"next_event_seq\":" << session.next_event_seq();
  out << ",\"scenes\":[";
  for (std::size_t i = 0; i < session.scenes().size(); ++i) {
    const Scene &scene = session.scenes()[i];
    if (i > 0) {
      out << ",";
    }
    out << "{";
    out << "\"id\":" << quote(scene.id) << ",";
    out << "\"title\":" << quote(scene.title) << ",";
    out << "\"location\":" << quote(scene.location) << ",";
    out << "\"participants\":[";
    bool first = true;
    for (const auto &participant : scene.participants) {
      if (!first) {
        out << ",";
      }
      first = false;
      out << quote(participant);
    }
    out << "],";
    out << "\"started_at\":" << quote(scene.started_at);
    if (scene.ended_at.has_value()) {
      out << ",\"ended_at\":" << quote(*scene.ended_at);
    }
    if (scene.summary.has_value()) {
      out << ",\"summary\":" << quote(*scene.summary);
    }
    out << ",\"active\":" << (scene.active ? "true" : "false");
    out << ",\"events\":[";
    for (std::size_t j = 0; j < scene.events.size(); ++j) {
      if (j > 0) {
        out << ",";
      }
      out << encode_event(scene.events[j]);
    }
    out << "]}";
  }
  out << "]}";
  return out.str();
}

common::Result<sessions::Session> decode_session(const std::string &document,
                                                 common::TimestampFn clock) {
  using R = common::Result<sessions::Session>;
  auto parsed = common::json_parse_object_raw(document);
  if (!parsed.has_value()) {
    return R::failure(storage_error("session document is not a JSON object"));
  }
  JsonRawObject object = std::move(*parsed);

  auto format = take_string(object, "format", "session");
  if (!format.ok()) {
    return R::failure(format.status());
  }
  if (format.value() != kSessionFormat) {
    return R::failure(storage_error("unsupported session format: " + format.value()));
  }
  const auto version_raw = take(object, "version");
  const auto version = version_raw.has_value() ? common::json_int_value(*version_raw) : std::nullopt;
  if (!version.has_value() || *version != kSessionFormatVersion) {
    return R::failure(storage_error("unsupported session format version"));
  }

  auto id = take_string(object, "id", "session");
  if (!id.ok()) {
    return R::failure(id.status());
  }
  auto created_at = take_string(object, "created_at", "session " + id.value());
  if (!created_at.ok()) {
    return R::failure(created_at.status());
  }
  auto active_scene_id = take_optional_string(object, "active_scene_id", "session " + id.value());
  if (!active_scene_id.ok()) {
    return R::failure(active_scene_id.status());
  }

  const auto seq_raw = take(object, "next_event_seq");
  const auto seq = seq_raw.has_value() ? common::json_int_value(*seq_raw) : std::nullopt;
  if (!seq.has_value() || *seq < 1) {
    return R::failure(storage_error("session " + id.value() +
                                    ": \"next_event_seq\" must be a positive integer"));
  }

  std::vector<Scene> scenes;
  if (const auto scenes_raw = take(object, "scenes"); scenes_raw.has_value()) {
    const auto scene_docs = common::json_split_top_level_objects(*scenes_raw);
    if (!scene_docs.has_value()) {
      return R::failure(storage_error("\"scenes\" must be an array of objects"));
    }
    scenes.reserve(scene_docs->size());
    for (const auto &scene_json : *scene_docs) {
      auto scene = decode_scene(scene_json);
      if (!scene.ok()) {
        return R::failure(scene.status());
      }
      scenes.push_back(std::move(scene.value()));
    }
  }

  std::optional<std::string> active_id;
  for (const auto &scene : scenes) {
    if (scene.active) {
      active_id = scene.id;
    }
  }
  if (active_id != active_scene_id.value()) {
    return R::failure(storage_error(
        "active_scene_id " + active_scene_id.value().value_or("(none)") +
        " does not match the active scene " + active_id.value_or("(none)")));
  }

  return sessions::Session::restore(id.value(), created_at.value(), std::move(scenes),
                                    static_cast<std::uint64_t>(*seq), std::move(clock));
}

} // namespace talekeeper::persistence
