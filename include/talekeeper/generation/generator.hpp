#pragma once

#include "talekeeper/common/result.hpp"
#include "talekeeper/context/assembler.hpp"

#include <string>
#include <variant>

namespace talekeeper::generation {

struct TextReply {
  std::string text;
};

struct ToolCallReply {
  std::string tool;
  /// JSON text as produced by the model.
  std::string arguments;
};

using GenerationReply = std::variant<TextReply, ToolCallReply>;

/// Text-generation service. Implementations own their transport; none ships here.
class Generator {
public:
  virtual ~Generator() = default;

  [[nodiscard]] virtual common::Result<GenerationReply> generate(const context::ContextPackage &context,
                                                                 const std::string &prompt) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace talekeeper::generation
