#pragma once

#include <string>
#include <vector>

#include <scheduler/birthdays_per_week.hpp>

namespace contact_book::views {

/// One "Weekday: name1, name2" line per bucket
std::vector<std::string> FormatBirthdaysPerWeek(
    const scheduler::BirthdaysPerWeek& birthdays);

}  // namespace contact_book::views
