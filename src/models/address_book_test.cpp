#include "address_book.hpp"

#include <userver/utest/utest.hpp>

#include <models/errors.hpp>

using contact_book::models::AddressBook;
using contact_book::models::InvalidFormatError;
using contact_book::models::NotFoundError;
using contact_book::models::ParseBirthday;
using contact_book::models::Record;

namespace {

std::vector<std::string> Names(const AddressBook& book) {
  std::vector<std::string> result;
  for (const auto& entry : book.GetEntries()) {
    result.push_back(entry.name);
  }
  return result;
}

}  // namespace

UTEST(AddressBook, AddAndFind) {
  AddressBook book;
  book.AddRecord("John", "1111111111");
  book.AddRecord("Jane", "2222222222", "24-03-1990");

  const auto* john = book.Find("John");
  ASSERT_NE(john, nullptr);
  EXPECT_EQ(john->GetName(), "John");
  ASSERT_EQ(john->GetPhones().size(), 1);
  EXPECT_EQ(john->GetPhones().front().GetValue(), "1111111111");
  EXPECT_FALSE(john->GetBirthday().has_value());

  const auto* jane = book.Find("Jane");
  ASSERT_NE(jane, nullptr);
  EXPECT_EQ(jane->GetBirthday(), ParseBirthday("24-03-1990"));

  EXPECT_EQ(book.Find("Nobody"), nullptr);
  EXPECT_EQ(Names(book), std::vector<std::string>({"John", "Jane"}));
}

UTEST(AddressBook, InvalidInputLeavesBookUntouched) {
  AddressBook book;
  EXPECT_THROW(book.AddRecord("John", "123"), InvalidFormatError);
  EXPECT_THROW(book.AddRecord("John", "1111111111", "31-02-2000"),
               InvalidFormatError);
  EXPECT_EQ(book.Find("John"), nullptr);
  EXPECT_EQ(book.Size(), 0);

  book.AddRecord("John", "1111111111");
  EXPECT_THROW(book.AddRecord("John", "2222"), InvalidFormatError);
  EXPECT_EQ(book.Find("John")->GetPhones().front().GetValue(), "1111111111");
}

UTEST(AddressBook, AddOverwritesInPlace) {
  AddressBook book;
  book.AddRecord("John", "1111111111", "01-01-1990");
  book.AddRecord("Jane", "2222222222");
  book.AddRecord("John", "3333333333");

  EXPECT_EQ(Names(book), std::vector<std::string>({"John", "Jane"}));
  const auto* john = book.Find("John");
  ASSERT_NE(john, nullptr);
  ASSERT_EQ(john->GetPhones().size(), 1);
  EXPECT_EQ(john->GetPhones().front().GetValue(), "3333333333");
  EXPECT_FALSE(john->GetBirthday().has_value());
}

UTEST(AddressBook, FindReturnsMutableRecord) {
  AddressBook book;
  book.AddRecord("John", "1111111111");
  book.Find("John")->AddPhone("2222222222");
  EXPECT_TRUE(book.Find("John")->FindPhone("2222222222").has_value());
}

UTEST(AddressBook, UpdateRecord) {
  AddressBook book;
  book.AddRecord("John", "1111111111");

  Record record{"John", ParseBirthday("05-05-1985")};
  record.AddPhone("4444444444");
  book.UpdateRecord("John", record);

  const auto* john = book.Find("John");
  ASSERT_NE(john, nullptr);
  EXPECT_TRUE(john->FindPhone("4444444444").has_value());
  EXPECT_FALSE(john->FindPhone("1111111111").has_value());
  EXPECT_EQ(john->GetBirthday(), ParseBirthday("05-05-1985"));

  EXPECT_THROW(book.UpdateRecord("Jane", record), NotFoundError);
  EXPECT_EQ(book.Find("Jane"), nullptr);
}

UTEST(AddressBook, Delete) {
  AddressBook book;
  book.AddRecord("John", "1111111111");
  book.AddRecord("Jane", "2222222222");
  book.AddRecord("Jack", "3333333333");

  book.Delete("Jane");
  EXPECT_EQ(book.Find("Jane"), nullptr);
  EXPECT_EQ(Names(book), std::vector<std::string>({"John", "Jack"}));
  ASSERT_NE(book.Find("Jack"), nullptr);
  EXPECT_EQ(book.Find("Jack")->GetPhones().front().GetValue(), "3333333333");

  book.Delete("Nobody");
  EXPECT_EQ(book.Size(), 2);

  book.AddRecord("Jane", "2222222222");
  EXPECT_EQ(Names(book), std::vector<std::string>({"John", "Jack", "Jane"}));
}

UTEST(AddressBook, GetBirthdaysPerWeek) {
  AddressBook book;
  book.AddRecord("NoBirthday", "1111111111");
  book.AddRecord("Saturday", "2222222222", "07-01-1990");
  book.AddRecord("Friday", "3333333333", "06-01-1991");
  book.AddRecord("Far", "4444444444", "20-01-1992");
  book.AddRecord("Sunday", "5555555555", "08-01-1993");

  // Wednesday
  const auto result = book.GetBirthdaysPerWeek(cctz::civil_day(2023, 1, 4));
  ASSERT_EQ(result.size(), 2);
  EXPECT_EQ(result[0].weekday, cctz::weekday::monday);
  EXPECT_EQ(result[0].persons,
            std::vector<std::string>({"Saturday", "Sunday"}));
  EXPECT_EQ(result[1].weekday, cctz::weekday::friday);
  EXPECT_EQ(result[1].persons, std::vector<std::string>{"Friday"});
}
