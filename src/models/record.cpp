#include "record.hpp"

#include <algorithm>

#include <fmt/format.h>

#include <models/errors.hpp>

namespace contact_book::models {

Record::Record(std::string name, std::optional<Birthday> birthday)
    : name_{std::move(name)}, birthday_{std::move(birthday)} {
  if (name_.empty()) {
    throw InvalidArgumentError("Contact name must not be empty");
  }
}

void Record::AddPhone(const std::string_view raw) {
  phones_.push_back(ParsePhone(raw));
}

void Record::RemovePhone(const std::string_view value) {
  std::erase_if(phones_, [value](const Phone& phone) {
    return phone.GetValue() == value;
  });
}

void Record::EditPhone(const std::string_view old_value,
                       const std::string_view new_value) {
  auto phone = ParsePhone(new_value);
  RemovePhone(old_value);
  phones_.push_back(std::move(phone));
}

std::optional<Phone> Record::FindPhone(const std::string_view value) const {
  const auto it = std::find_if(
      phones_.begin(), phones_.end(),
      [value](const Phone& phone) { return phone.GetValue() == value; });
  if (it == phones_.end()) {
    return std::nullopt;
  }
  return *it;
}

void Record::AddBirthday(const Birthday& birthday) { birthday_ = birthday; }

std::string ToString(const Record& record) {
  std::vector<std::string> phones;
  phones.reserve(record.GetPhones().size());
  for (const auto& phone : record.GetPhones()) {
    phones.push_back(phone.GetValue());
  }

  std::string birthday;
  if (record.GetBirthday().has_value()) {
    birthday = fmt::format(", birthday: {}", ToString(*record.GetBirthday()));
  }
  return fmt::format("Contact name: {}, phones: {}{}", record.GetName(),
                     fmt::join(phones, "; "), birthday);
}

}  // namespace contact_book::models
