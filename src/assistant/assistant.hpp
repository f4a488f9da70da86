#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <cctz/civil_time.h>
#include <cctz/time_zone.h>
#include <fmt/color.h>

#include <models/address_book.hpp>
#include <views/console.hpp>

namespace contact_book::assistant {

struct Reply {
  std::string text;
  std::optional<fmt::terminal_color> color{};
};

class Assistant final {
 public:
  Assistant(models::AddressBook& book, views::Console& console,
            const cctz::time_zone& timezone);

  /// Reads commands until `close`, `exit` or the end of input
  void Run(std::istream& input);

  /// Returns false once the session is over
  bool ProcessLine(std::string_view line);

 private:
  using Args = std::vector<std::string>;
  using Handler = Reply (Assistant::*)(const Args&);

  models::AddressBook& book_;
  views::Console& console_;
  cctz::time_zone timezone_;
  std::unordered_map<std::string, Handler> commands_;

 private:
  void RegisterCommand(const std::string& command, Handler handler);
  Reply Dispatch(const std::string& command, const Args& args);
  models::Record& FindRecord(const std::string& name);
  cctz::civil_day GetToday() const;

  Reply OnHelloCommand(const Args& args);
  Reply OnHelpCommand(const Args& args);
  Reply OnAddCommand(const Args& args);
  Reply OnChangeCommand(const Args& args);
  Reply OnPhoneCommand(const Args& args);
  Reply OnAllCommand(const Args& args);
  Reply OnAddBirthdayCommand(const Args& args);
  Reply OnShowBirthdayCommand(const Args& args);
  Reply OnBirthdaysCommand(const Args& args);
  Reply OnAddPhoneCommand(const Args& args);
  Reply OnRemovePhoneCommand(const Args& args);
  Reply OnDeleteCommand(const Args& args);
};

}  // namespace contact_book::assistant
