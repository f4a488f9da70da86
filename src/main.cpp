#include <exception>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <userver/logging/format.hpp>
#include <userver/logging/log.hpp>
#include <userver/logging/logger.hpp>

#include <assistant/assistant.hpp>
#include <config.hpp>
#include <models/address_book.hpp>
#include <views/console.hpp>

namespace {

const std::string kLoggerName = "default";

userver::logging::LoggerPtr MakeLogger(const contact_book::Config& config) {
  if (config.log_file.has_value()) {
    return userver::logging::MakeFileLogger(kLoggerName, *config.log_file,
                                            userver::logging::Format::kTskv,
                                            config.log_level);
  }
  return userver::logging::MakeStderrLogger(
      kLoggerName, userver::logging::Format::kTskv, config.log_level);
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace po = boost::program_options;

  po::options_description desc("Allowed options");
  desc.add_options()("help,h", "produce this help message")(
      "config,c", po::value<std::string>()->default_value(""),
      "path to the YAML config");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error& exc) {
    std::cerr << exc.what() << "\n\n" << desc << '\n';
    return 1;
  }

  if (vm.count("help")) {
    std::cout << desc << '\n';
    return 0;
  }

  try {
    const auto config =
        contact_book::LoadConfig(vm["config"].as<std::string>());
    userver::logging::DefaultLoggerGuard logger_guard{MakeLogger(config)};
    LOG_INFO() << "Starting contact-book";

    contact_book::models::AddressBook book;
    contact_book::views::Console console{std::cout, config.colors};
    contact_book::assistant::Assistant assistant{book, console,
                                                 config.timezone};
    assistant.Run(std::cin);
  } catch (const std::exception& exc) {
    std::cerr << "Failed to run contact-book: " << exc.what() << '\n';
    return 1;
  }
  return 0;
}
