#include "contacts_table.hpp"

#include <vector>

#include <fmt/format.h>

namespace contact_book::views {

namespace {

const std::size_t kNameWidth = 20;
const std::size_t kPhonesWidth = 40;
const std::size_t kBirthdayWidth = 20;

std::string FormatRow(const std::string& name, const std::string& phones,
                      const std::string& birthday) {
  return fmt::format("{:<{}} {:<{}} {:<{}}", name, kNameWidth, phones,
                     kPhonesWidth, birthday, kBirthdayWidth);
}

}  // namespace

std::string FormatContactsTable(const models::AddressBook& book) {
  std::vector<std::string> lines;
  lines.reserve(book.Size() + 2);
  lines.push_back(FormatRow("Name", "Phones", "Birthday"));
  lines.push_back(
      std::string(kNameWidth + kPhonesWidth + kBirthdayWidth + 2, '-'));

  for (const auto& entry : book.GetEntries()) {
    std::vector<std::string> phones;
    for (const auto& phone : entry.record.GetPhones()) {
      phones.push_back(phone.GetValue());
    }
    const auto& birthday = entry.record.GetBirthday();
    lines.push_back(FormatRow(
        entry.name, fmt::format("{}", fmt::join(phones, ", ")),
        birthday.has_value() ? models::ToString(*birthday) : "None"));
  }
  return fmt::format("{}", fmt::join(lines, "\n"));
}

}  // namespace contact_book::views
