#include "address_book.hpp"

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include <models/errors.hpp>

namespace contact_book::models {

void AddressBook::AddRecord(const std::string& name,
                            const std::string_view phone,
                            const std::optional<std::string>& birthday) {
  std::optional<Birthday> parsed_birthday;
  if (birthday.has_value()) {
    parsed_birthday = ParseBirthday(*birthday);
  }
  Record record{name, parsed_birthday};
  record.AddPhone(phone);

  const auto it = index_.find(name);
  if (it != index_.end()) {
    LOG_INFO() << "Overwrite contact " << name;
    entries_[it->second].record = std::move(record);
    return;
  }

  index_.emplace(name, entries_.size());
  entries_.push_back(Entry{.name = name, .record = std::move(record)});
}

Record* AddressBook::Find(const std::string& name) {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].record;
}

const Record* AddressBook::Find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].record;
}

void AddressBook::UpdateRecord(const std::string& name, Record record) {
  auto* existing = Find(name);
  if (existing == nullptr) {
    throw NotFoundError(fmt::format("Contact not found: {}", name));
  }
  *existing = std::move(record);
}

void AddressBook::Delete(const std::string& name) {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return;
  }

  const auto position = it->second;
  index_.erase(it);
  entries_.erase(entries_.begin() + position);
  for (auto i = position; i < entries_.size(); ++i) {
    index_[entries_[i].name] = i;
  }
}

scheduler::BirthdaysPerWeek AddressBook::GetBirthdaysPerWeek(
    const cctz::civil_day& today) const {
  std::vector<scheduler::BirthdayRow> rows;
  for (const auto& entry : entries_) {
    const auto& birthday = entry.record.GetBirthday();
    if (!birthday.has_value()) {
      continue;
    }
    rows.push_back(scheduler::BirthdayRow{
        .person = entry.name, .m = birthday->m, .d = birthday->d});
  }
  return scheduler::FindBirthdaysPerWeek(rows, today);
}

}  // namespace contact_book::models
