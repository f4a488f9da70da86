#pragma once

#include <optional>
#include <ostream>
#include <string>

#include <fmt/color.h>

namespace contact_book::views {

class Console final {
 public:
  Console(std::ostream& output, bool colors_enabled);

  void Print(const std::string& text,
             std::optional<fmt::terminal_color> color = std::nullopt);

  /// Writes `text` without a line break
  void Prompt(const std::string& text);

 private:
  std::ostream& output_;
  bool colors_enabled_;
};

}  // namespace contact_book::views
