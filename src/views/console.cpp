#include "console.hpp"

namespace contact_book::views {

Console::Console(std::ostream& output, const bool colors_enabled)
    : output_{output}, colors_enabled_{colors_enabled} {}

void Console::Print(const std::string& text,
                    const std::optional<fmt::terminal_color> color) {
  if (color.has_value() && colors_enabled_) {
    output_ << fmt::format(fmt::fg(*color), "{}", text) << '\n';
  } else {
    output_ << text << '\n';
  }
  output_.flush();
}

void Console::Prompt(const std::string& text) {
  output_ << text;
  output_.flush();
}

}  // namespace contact_book::views
