#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <cctz/civil_time.h>

#include <models/birthday.hpp>

namespace contact_book::scheduler {

struct BirthdayRow {
  std::string person;
  models::BirthdayMonth m{};
  models::BirthdayDay d{};
};

struct WeekdayBirthdays {
  cctz::weekday weekday{};
  std::vector<std::string> persons;

  bool operator==(const WeekdayBirthdays& other) const = default;
};

/// Buckets come in order of first appearance, persons in row order
using BirthdaysPerWeek = std::vector<WeekdayBirthdays>;

/// @brief Finds birthdays to celebrate during the 7 days starting at `today`.
///
/// Birthdays falling on a weekend are celebrated on the following Monday.
/// On Monday the two days of the previous weekend are reported as well, and
/// the seventh day of the window is left for the next week.
BirthdaysPerWeek FindBirthdaysPerWeek(const std::vector<BirthdayRow>& rows,
                                      const cctz::civil_day& today);

std::string_view ToString(cctz::weekday weekday);

}  // namespace contact_book::scheduler
