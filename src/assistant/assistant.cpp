#include "assistant.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

#include <models/errors.hpp>
#include <views/birthdays.hpp>
#include <views/contacts_table.hpp>

namespace contact_book::assistant {

namespace {

const std::string kWelcome = "Welcome to the assistant bot!";
const std::string kGoodbye = "Goodbye!";
const std::string kPrompt = "Enter a command: ";
const std::string kInvalidCommand = "Invalid command.";
const std::string kMissingArguments =
    "Invalid command. Please provide the required arguments.";

const std::string kHelp = R"(Commands:
  hello
  add <name> <phone>
  change <name> <new phone>
  phone <name>
  all
  add-birthday <name> <DD-MM-YYYY>
  show-birthday <name>
  birthdays
  add-phone <name> <phone>
  remove-phone <name> <phone>
  delete <name>
  close, exit)";

std::vector<std::string> Tokenize(const std::string_view line) {
  std::istringstream stream{std::string{line}};
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

void CheckArgsCount(const std::vector<std::string>& args,
                    const std::size_t expected, const std::string& usage) {
  if (args.size() != expected) {
    throw models::InvalidArgumentError(usage);
  }
}

std::string JoinPhones(const models::Record& record,
                       const std::string_view separator) {
  std::vector<std::string> phones;
  phones.reserve(record.GetPhones().size());
  for (const auto& phone : record.GetPhones()) {
    phones.push_back(phone.GetValue());
  }
  return fmt::format("{}", fmt::join(phones, separator));
}

}  // namespace

Assistant::Assistant(models::AddressBook& book, views::Console& console,
                     const cctz::time_zone& timezone)
    : book_{book}, console_{console}, timezone_{timezone} {
  RegisterCommand("add", &Assistant::OnAddCommand);
  RegisterCommand("add-birthday", &Assistant::OnAddBirthdayCommand);
  RegisterCommand("add-phone", &Assistant::OnAddPhoneCommand);
  RegisterCommand("all", &Assistant::OnAllCommand);
  RegisterCommand("birthdays", &Assistant::OnBirthdaysCommand);
  RegisterCommand("change", &Assistant::OnChangeCommand);
  RegisterCommand("delete", &Assistant::OnDeleteCommand);
  RegisterCommand("hello", &Assistant::OnHelloCommand);
  RegisterCommand("help", &Assistant::OnHelpCommand);
  RegisterCommand("phone", &Assistant::OnPhoneCommand);
  RegisterCommand("remove-phone", &Assistant::OnRemovePhoneCommand);
  RegisterCommand("show-birthday", &Assistant::OnShowBirthdayCommand);
}

void Assistant::Run(std::istream& input) {
  console_.Print(kWelcome, fmt::terminal_color::red);

  std::string line;
  while (true) {
    console_.Prompt(kPrompt);
    if (!std::getline(input, line)) {
      LOG_INFO() << "End of input";
      console_.Print(kGoodbye, fmt::terminal_color::red);
      return;
    }
    if (!ProcessLine(line)) {
      return;
    }
  }
}

bool Assistant::ProcessLine(const std::string_view line) {
  auto args = Tokenize(line);
  if (args.empty()) {
    return true;
  }

  const auto command = ToLower(args.front());
  args.erase(args.begin());
  LOG_INFO() << "Got command " << command;

  if (command == "close" || command == "exit") {
    console_.Print(kGoodbye, fmt::terminal_color::red);
    return false;
  }

  try {
    const auto reply = Dispatch(command, args);
    console_.Print(reply.text, reply.color);
  } catch (const std::exception& exc) {
    LOG_ERROR() << "Unexpected exception " << exc;
    throw;
  }
  return true;
}

void Assistant::RegisterCommand(const std::string& command,
                                const Handler handler) {
  commands_.emplace(command, handler);
}

Reply Assistant::Dispatch(const std::string& command, const Args& args) {
  const auto it = commands_.find(command);
  if (it == commands_.end()) {
    return {kInvalidCommand, fmt::terminal_color::blue};
  }

  try {
    return (this->*(it->second))(args);
  } catch (const models::InvalidFormatError& exc) {
    LOG_WARNING() << "Invalid format in " << command << ": " << exc.what();
    return {exc.what()};
  } catch (const models::NotFoundError& exc) {
    LOG_WARNING() << "Not found in " << command << ": " << exc.what();
    return {exc.what()};
  } catch (const models::InvalidArgumentError& exc) {
    LOG_WARNING() << "Invalid arguments for " << command;
    return {exc.what()};
  }
}

models::Record& Assistant::FindRecord(const std::string& name) {
  auto* record = book_.Find(name);
  if (record == nullptr) {
    throw models::NotFoundError(fmt::format("Contact not found: {}", name));
  }
  return *record;
}

cctz::civil_day Assistant::GetToday() const {
  const auto now = userver::utils::datetime::Now();
  LOG_DEBUG() << "at " << userver::utils::datetime::Timestring(now);
  return cctz::civil_day(cctz::convert(now, timezone_));
}

Reply Assistant::OnHelloCommand(const Args&) {
  return {"How can I help you?", fmt::terminal_color::yellow};
}

Reply Assistant::OnHelpCommand(const Args&) { return {kHelp}; }

Reply Assistant::OnAddCommand(const Args& args) {
  CheckArgsCount(args, 2,
                 "Invalid command. Please provide a name and a phone number.");
  const auto& name = args[0];
  const auto& phone = args[1];
  book_.AddRecord(name, phone);
  return {fmt::format("Contact {} with phone {} added successfully.", name,
                      phone)};
}

Reply Assistant::OnChangeCommand(const Args& args) {
  CheckArgsCount(args, 2,
                 "Invalid command. Please provide a name and a new phone "
                 "number.");
  const auto& name = args[0];
  // Edited on a copy, the book changes only when the edit succeeds
  models::Record record = FindRecord(name);
  if (record.GetPhones().empty()) {
    throw models::InvalidArgumentError(kMissingArguments);
  }

  const auto old_phone = record.GetPhones().front().GetValue();
  record.EditPhone(old_phone, args[1]);
  book_.UpdateRecord(name, std::move(record));
  return {"Contact updated."};
}

Reply Assistant::OnPhoneCommand(const Args& args) {
  CheckArgsCount(args, 1, "Invalid command. Please provide a name.");
  const auto& record = FindRecord(args[0]);
  return {fmt::format("{}: {}", record.GetName(), JoinPhones(record, ", "))};
}

Reply Assistant::OnAllCommand(const Args& args) {
  if (!args.empty()) {
    throw models::InvalidArgumentError(
        "Invalid command. 'all' command doesn't require additional "
        "arguments.");
  }
  if (book_.Size() == 0) {
    return {"No contacts found."};
  }
  return {views::FormatContactsTable(book_)};
}

Reply Assistant::OnAddBirthdayCommand(const Args& args) {
  CheckArgsCount(args, 2,
                 "Invalid command. Please provide a name and a birthday "
                 "(format: DD-MM-YYYY).");
  const auto& name = args[0];
  auto& record = FindRecord(name);
  record.AddBirthday(models::ParseBirthday(args[1]));
  return {fmt::format("Birthday added for {}.", name)};
}

Reply Assistant::OnShowBirthdayCommand(const Args& args) {
  CheckArgsCount(args, 1, "Invalid command. Please provide a name.");
  const auto& name = args[0];
  const auto& record = FindRecord(name);
  if (!record.GetBirthday().has_value()) {
    return {fmt::format("{} has no recorded birthday.", name)};
  }
  return {fmt::format("{}'s birthday: {}", name,
                      models::ToString(*record.GetBirthday()))};
}

Reply Assistant::OnBirthdaysCommand(const Args& args) {
  if (!args.empty()) {
    throw models::InvalidArgumentError(
        "Invalid command. 'birthdays' command doesn't require additional "
        "arguments.");
  }

  const auto lines =
      views::FormatBirthdaysPerWeek(book_.GetBirthdaysPerWeek(GetToday()));
  if (lines.empty()) {
    return {"No birthdays in the next week."};
  }
  return {fmt::format("{}", fmt::join(lines, "\n"))};
}

Reply Assistant::OnAddPhoneCommand(const Args& args) {
  CheckArgsCount(args, 2,
                 "Invalid command. Please provide a name and a phone number.");
  const auto& name = args[0];
  FindRecord(name).AddPhone(args[1]);
  return {fmt::format("Phone {} added for {}.", args[1], name)};
}

Reply Assistant::OnRemovePhoneCommand(const Args& args) {
  CheckArgsCount(args, 2,
                 "Invalid command. Please provide a name and a phone number.");
  const auto& name = args[0];
  const auto& phone = args[1];
  auto& record = FindRecord(name);
  if (!record.FindPhone(phone).has_value()) {
    throw models::NotFoundError(fmt::format("Phone not found: {}", phone));
  }
  record.RemovePhone(phone);
  return {fmt::format("Phone {} removed for {}.", phone, name)};
}

Reply Assistant::OnDeleteCommand(const Args& args) {
  CheckArgsCount(args, 1, "Invalid command. Please provide a name.");
  const auto& name = args[0];
  FindRecord(name);
  book_.Delete(name);
  return {fmt::format("Contact {} deleted.", name)};
}

}  // namespace contact_book::assistant
