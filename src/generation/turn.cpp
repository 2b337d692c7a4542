#include "talekeeper/generation/turn.hpp"

#include "talekeeper/observability/global.hpp"

#include <type_traits>
#include <variant>

namespace talekeeper::generation {

common::Result<TurnOutcome> run_turn(sessions::SessionLog &log,
                                     const context::ContextAssembler &assembler,
                                     Generator &generator, const context::TokenBudget budget,
                                     const std::string &player_input,
                                     std::optional<std::string> actor) {
  using R = common::Result<TurnOutcome>;

  auto player_event =
      log.log_text_event(sessions::EventType::PlayerAction, player_input, std::move(actor));
  if (!player_event.ok()) {
    return R::failure(player_event.status());
  }

  const sessions::Session snapshot = log.snapshot();
  context::ContextPackage package = assembler.build(snapshot, budget);

  auto reply = generator.generate(package, player_input);
  if (!reply.ok()) {
    observability::record_error("generation", generator.name() + ": " + reply.error());
    return R::failure(reply.status());
  }

  common::Result<std::string> reply_event = std::visit(
      [&log](const auto &r) -> common::Result<std::string> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, TextReply>) {
          return log.log_text_event(sessions::EventType::Narration, r.text,
                                    std::string(kNarratorActor));
        } else {
          return log.log_event(sessions::ToolCallPayload{r.tool, r.arguments, ""},
                               std::string(kNarratorActor));
        }
      },
      reply.value());
  if (!reply_event.ok()) {
    return R::failure(reply_event.status());
  }

  TurnOutcome outcome{player_event.value(), reply_event.value(), reply.value(),
                      std::move(package)};
  return R::success(std::move(outcome));
}

} // namespace talekeeper::generation
