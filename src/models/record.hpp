#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <models/birthday.hpp>
#include <models/phone.hpp>

namespace contact_book::models {

class Record {
 public:
  explicit Record(std::string name,
                  std::optional<Birthday> birthday = std::nullopt);

  const std::string& GetName() const { return name_; }
  const std::vector<Phone>& GetPhones() const { return phones_; }
  const std::optional<Birthday>& GetBirthday() const { return birthday_; }

  /// Appends without deduplication, throws InvalidFormatError
  void AddPhone(std::string_view raw);

  /// Removes every phone equal to `value`, does nothing if there is none
  void RemovePhone(std::string_view value);

  /// Validates `new_value` before touching the list, so a failed edit keeps
  /// the old phone
  void EditPhone(std::string_view old_value, std::string_view new_value);

  std::optional<Phone> FindPhone(std::string_view value) const;

  void AddBirthday(const Birthday& birthday);

 private:
  std::string name_;
  std::vector<Phone> phones_;
  std::optional<Birthday> birthday_;
};

std::string ToString(const Record& record);

}  // namespace contact_book::models
