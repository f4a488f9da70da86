#pragma once

#include <optional>
#include <string>

#include <cctz/time_zone.h>

#include <userver/formats/parse/to.hpp>
#include <userver/formats/yaml/value.hpp>
#include <userver/logging/level.hpp>

namespace contact_book {

struct Config {
  cctz::time_zone timezone;
  bool colors{true};
  userver::logging::Level log_level{userver::logging::Level::kWarning};
  std::optional<std::string> log_file;
};

Config Parse(const userver::formats::yaml::Value& value,
             userver::formats::parse::To<Config>);

// Defaults are used when `path` is empty
Config LoadConfig(const std::string& path);

}  // namespace contact_book
