#pragma once

#include <string>

#include <models/address_book.hpp>

namespace contact_book::views {

// Name, Phones and Birthday columns, one row per contact
std::string FormatContactsTable(const models::AddressBook& book);

}  // namespace contact_book::views
