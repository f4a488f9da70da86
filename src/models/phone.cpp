#include "phone.hpp"

#include <regex>

#include <models/errors.hpp>

namespace contact_book::models {

namespace {

const std::regex kPhoneRegex{R"(\d{10})"};

}  // namespace

Phone::Phone(std::string value) : value_{std::move(value)} {
  if (!std::regex_match(value_, kPhoneRegex)) {
    throw InvalidFormatError("Invalid phone number format");
  }
}

Phone ParsePhone(const std::string_view raw) { return Phone{std::string{raw}}; }

}  // namespace contact_book::models
