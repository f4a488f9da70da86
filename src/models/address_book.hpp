#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <cctz/civil_time.h>

#include <models/record.hpp>
#include <scheduler/birthdays_per_week.hpp>

namespace contact_book::models {

class AddressBook {
 public:
  struct Entry {
    std::string name;
    Record record;
  };

  /// Overwrites a contact with the same name silently. Nothing is stored if
  /// the phone or the birthday is invalid.
  void AddRecord(const std::string& name, std::string_view phone,
                 const std::optional<std::string>& birthday = std::nullopt);

  // may return nullptr, valid until the next change of the book
  Record* Find(const std::string& name);
  const Record* Find(const std::string& name) const;

  /// Throws NotFoundError if there is no contact named `name`
  void UpdateRecord(const std::string& name, Record record);

  void Delete(const std::string& name);

  /// Entries in insertion order
  const std::vector<Entry>& GetEntries() const { return entries_; }
  std::size_t Size() const { return entries_.size(); }

  scheduler::BirthdaysPerWeek GetBirthdaysPerWeek(
      const cctz::civil_day& today) const;

 private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace contact_book::models
