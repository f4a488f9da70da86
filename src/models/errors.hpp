#pragma once

#include <stdexcept>

namespace contact_book::models {

class InvalidFormatError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidArgumentError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace contact_book::models
