#pragma once

#include <string>
#include <string_view>

namespace contact_book::models {

// Exactly 10 decimal digits, no separators or country code
class Phone {
 public:
  explicit Phone(std::string value);

  const std::string& GetValue() const { return value_; }

  bool operator==(const Phone& other) const = default;

 private:
  std::string value_;
};

Phone ParsePhone(std::string_view raw);

}  // namespace contact_book::models
