#include "birthdays.hpp"

#include <fmt/format.h>

namespace contact_book::views {

std::vector<std::string> FormatBirthdaysPerWeek(
    const scheduler::BirthdaysPerWeek& birthdays) {
  std::vector<std::string> lines;
  lines.reserve(birthdays.size());
  for (const auto& bucket : birthdays) {
    lines.push_back(fmt::format("{}: {}", scheduler::ToString(bucket.weekday),
                                fmt::join(bucket.persons, ", ")));
  }
  return lines;
}

}  // namespace contact_book::views
