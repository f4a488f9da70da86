#include "birthdays_per_week.hpp"

#include <algorithm>
#include <iterator>

#include <userver/logging/log.hpp>

namespace contact_book::scheduler {

namespace {

const cctz::diff_t kWindowDays = 7;
const cctz::diff_t kLookBehindDays = 2;

bool IsWeekend(const cctz::weekday weekday) {
  return weekday == cctz::weekday::saturday ||
         weekday == cctz::weekday::sunday;
}

// 29.02 turns into 01.03 in non-leap years
cctz::civil_day MakeOccurrence(const cctz::year_t year,
                               const models::BirthdayMonth m,
                               const models::BirthdayDay d) {
  return cctz::civil_day(year, m.GetUnderlying(), d.GetUnderlying());
}

cctz::civil_day FindNearestOccurrence(const BirthdayRow& row,
                                      const cctz::civil_day& today) {
  const auto this_year = MakeOccurrence(today.year(), row.m, row.d);
  if (this_year - today < -kLookBehindDays) {
    return MakeOccurrence(today.year() + 1, row.m, row.d);
  }

  const auto last_year = MakeOccurrence(today.year() - 1, row.m, row.d);
  if (last_year - today >= -kLookBehindDays) {
    return last_year;
  }
  return this_year;
}

void Append(BirthdaysPerWeek& result, const cctz::weekday weekday,
            const std::string& person) {
  auto it = std::find_if(result.begin(), result.end(),
                         [weekday](const WeekdayBirthdays& bucket) {
                           return bucket.weekday == weekday;
                         });
  if (it == result.end()) {
    result.push_back(WeekdayBirthdays{.weekday = weekday, .persons = {}});
    it = std::prev(result.end());
  }
  it->persons.push_back(person);
}

}  // namespace

BirthdaysPerWeek FindBirthdaysPerWeek(const std::vector<BirthdayRow>& rows,
                                      const cctz::civil_day& today) {
  const auto today_weekday = cctz::get_weekday(today);
  const bool is_monday = today_weekday == cctz::weekday::monday;
  const bool is_sunday = today_weekday == cctz::weekday::sunday;
  const bool is_midweek = !is_monday && !IsWeekend(today_weekday);

  BirthdaysPerWeek result;
  for (const auto& row : rows) {
    auto occurrence = FindNearestOccurrence(row, today);

    // Midweek the days already passed are not reported at all
    if (occurrence < today && occurrence - today > -(kLookBehindDays + 1) &&
        is_midweek) {
      occurrence = MakeOccurrence(occurrence.year() + 1, row.m, row.d);
    }

    const auto delta_days = occurrence - today;
    if (delta_days >= kWindowDays || delta_days < -kLookBehindDays) {
      LOG_DEBUG() << "Skip birthday outside of the week";
      continue;
    }

    auto weekday = cctz::get_weekday(today + delta_days);
    if (delta_days >= 0 && is_midweek) {
      if (IsWeekend(weekday)) {
        weekday = cctz::weekday::monday;
      }
    } else if (is_monday && delta_days > kWindowDays - 2) {
      LOG_DEBUG() << "Skip birthday left for the next week";
      continue;
    } else if (is_monday && delta_days <= 0) {
      weekday = cctz::weekday::monday;
    } else if (is_sunday && delta_days == 0) {
      weekday = cctz::weekday::monday;
    }

    Append(result, weekday, row.person);
  }
  return result;
}

std::string_view ToString(const cctz::weekday weekday) {
  switch (weekday) {
    case cctz::weekday::monday:
      return "Monday";
    case cctz::weekday::tuesday:
      return "Tuesday";
    case cctz::weekday::wednesday:
      return "Wednesday";
    case cctz::weekday::thursday:
      return "Thursday";
    case cctz::weekday::friday:
      return "Friday";
    case cctz::weekday::saturday:
      return "Saturday";
    case cctz::weekday::sunday:
      return "Sunday";
  }
  return "Unknown";
}

}  // namespace contact_book::scheduler
