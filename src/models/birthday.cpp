#include "birthday.hpp"

#include <chrono>
#include <regex>

#include <fmt/format.h>

#include <models/errors.hpp>

namespace contact_book::models {

namespace {

const std::regex kBirthdayRegex{R"((\d{2})-(\d{2})-(\d{4}))"};

const std::string kInvalidBirthdayMessage =
    "Invalid birthday format. Use 'DD-MM-YYYY'.";

}  // namespace

bool IsValidDate(const BirthdayYear y, const BirthdayMonth m,
                 const BirthdayDay d) {
  if (y.GetUnderlying() < 1 || m.GetUnderlying() < 0 ||
      d.GetUnderlying() < 0) {
    return false;
  }
  const std::chrono::year_month_day date{
      std::chrono::year{y.GetUnderlying()},
      std::chrono::month{static_cast<unsigned int>(m.GetUnderlying())},
      std::chrono::day{static_cast<unsigned int>(d.GetUnderlying())}};
  return date.ok();
}

Birthday ParseBirthday(const std::string_view raw) {
  const std::string value{raw};
  std::smatch match;
  if (!std::regex_match(value, match, kBirthdayRegex)) {
    throw InvalidFormatError(kInvalidBirthdayMessage);
  }

  const Birthday birthday{.d = BirthdayDay{std::stoi(match[1])},
                          .m = BirthdayMonth{std::stoi(match[2])},
                          .y = BirthdayYear{std::stoi(match[3])}};
  if (!IsValidDate(birthday.y, birthday.m, birthday.d)) {
    throw InvalidFormatError(kInvalidBirthdayMessage);
  }
  return birthday;
}

std::string ToString(const Birthday& birthday) {
  return fmt::format("{:02}-{:02}-{:04}", birthday.d.GetUnderlying(),
                     birthday.m.GetUnderlying(), birthday.y.GetUnderlying());
}

}  // namespace contact_book::models
