#include "config.hpp"

#include <stdexcept>

#include <userver/formats/parse/common_containers.hpp>
#include <userver/formats/yaml/serialize.hpp>

namespace contact_book {

namespace {

const std::string kDefaultTimezone = "UTC";
const std::string kDefaultLogLevel = "warning";

}  // namespace

Config Parse(const userver::formats::yaml::Value& value,
             userver::formats::parse::To<Config>) {
  Config config;

  const auto timezone_name =
      value["timezone"].As<std::string>(kDefaultTimezone);
  if (!cctz::load_time_zone(timezone_name, &config.timezone)) {
    throw std::runtime_error("Unknown timezone " + timezone_name);
  }

  config.colors = value["colors"].As<bool>(true);

  const auto logging = value["logging"];
  config.log_level = userver::logging::LevelFromString(
      logging["level"].As<std::string>(kDefaultLogLevel));
  config.log_file = logging["file"].As<std::optional<std::string>>();
  return config;
}

Config LoadConfig(const std::string& path) {
  if (path.empty()) {
    return userver::formats::yaml::FromString("{}").As<Config>();
  }
  return userver::formats::yaml::blocking::FromFile(path).As<Config>();
}

}  // namespace contact_book
