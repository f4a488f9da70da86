#pragma once

#include <string>
#include <string_view>

#include <userver/utils/strong_typedef.hpp>

namespace contact_book::models {

using BirthdayDay = userver::utils::StrongTypedef<class BirthdayDayTag, int>;
using BirthdayMonth =
    userver::utils::StrongTypedef<class BirthdayMonthTag, int>;
using BirthdayYear = userver::utils::StrongTypedef<class BirthdayYearTag, int>;

struct Birthday {
  BirthdayDay d{};
  BirthdayMonth m{};
  BirthdayYear y{};

  bool operator==(const Birthday& other) const = default;
};

bool IsValidDate(BirthdayYear y, BirthdayMonth m, BirthdayDay d);

// Accepts DD-MM-YYYY only, throws InvalidFormatError otherwise
Birthday ParseBirthday(std::string_view raw);

std::string ToString(const Birthday& birthday);

}  // namespace contact_book::models
