#pragma once

#include "talekeeper/context/assembler.hpp"
#include "talekeeper/generation/generator.hpp"
#include "talekeeper/sessions/log.hpp"

#include <optional>
#include <string>

namespace talekeeper::generation {

constexpr const char *kNarratorActor = "dm";

struct TurnOutcome {
  std::string player_event_id;
  std::string reply_event_id;
  GenerationReply reply;
  context::ContextPackage context;
};

/// Logs the player's input, asks the generator for the next beat over a snapshot of the log and
/// logs the reply. A generator failure is returned as is and logs nothing further.
[[nodiscard]] common::Result<TurnOutcome>
run_turn(sessions::SessionLog &log, const context::ContextAssembler &assembler,
         Generator &generator, context::TokenBudget budget, const std::string &player_input,
         std::optional<std::string> actor = std::nullopt);

} // namespace talekeeper::generation
