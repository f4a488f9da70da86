#include <sstream>

#include <userver/utest/utest.hpp>

#include <views/birthdays.hpp>
#include <views/console.hpp>
#include <views/contacts_table.hpp>

using contact_book::models::AddressBook;
using contact_book::scheduler::BirthdaysPerWeek;
using contact_book::views::Console;
using contact_book::views::FormatBirthdaysPerWeek;
using contact_book::views::FormatContactsTable;

UTEST(FormatBirthdaysPerWeek, OneLinePerWeekday) {
  const BirthdaysPerWeek birthdays{
      {cctz::weekday::monday, {"John", "Jane"}},
      {cctz::weekday::friday, {"Jack"}},
  };
  EXPECT_EQ(FormatBirthdaysPerWeek(birthdays),
            std::vector<std::string>({"Monday: John, Jane", "Friday: Jack"}));
  EXPECT_TRUE(FormatBirthdaysPerWeek({}).empty());
}

UTEST(FormatContactsTable, Rows) {
  AddressBook book;
  book.AddRecord("John", "1111111111", "24-03-1990");
  book.AddRecord("Jane", "2222222222");
  book.Find("Jane")->AddPhone("3333333333");

  const auto table = FormatContactsTable(book);
  std::istringstream stream{table};
  std::vector<std::string> lines;
  for (std::string line; std::getline(stream, line);) {
    lines.push_back(line);
  }

  ASSERT_EQ(lines.size(), 4);
  EXPECT_EQ(lines[0].substr(0, 21), "Name                 ");
  EXPECT_NE(lines[0].find("Phones"), std::string::npos);
  EXPECT_EQ(lines[0].find("Birthday"), 62);
  EXPECT_EQ(lines[1], std::string(82, '-'));
  EXPECT_EQ(lines[2].substr(0, 4), "John");
  EXPECT_EQ(lines[2].find("1111111111"), 21);
  EXPECT_EQ(lines[2].find("24-03-1990"), 62);
  EXPECT_NE(lines[3].find("2222222222, 3333333333"), std::string::npos);
  EXPECT_EQ(lines[3].find("None"), 62);
}

UTEST(Console, PlainOutput) {
  std::ostringstream output;
  Console console{output, false};
  console.Prompt("> ");
  console.Print("hello", fmt::terminal_color::red);
  console.Print("world");
  EXPECT_EQ(output.str(), "> hello\nworld\n");
}

UTEST(Console, ColoredOutput) {
  std::ostringstream output;
  Console console{output, true};
  console.Print("hello", fmt::terminal_color::red);
  console.Print("world");
  EXPECT_EQ(output.str(), "\x1b[31mhello\x1b[0m\nworld\n");
}
