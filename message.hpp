#ifndef MESSAGE_DOT_HPP_INCLUDED
#define MESSAGE_DOT_HPP_INCLUDED

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "iequal.hpp"

// Just enough RFC 5322 to split a message into its header fields and
// its body.  Everything is a view into the caller's buffer, which must
// outlive the parsed object; nothing here modifies the message.

namespace message {

// RFC-5322 header names
auto constexpr DKIM_Signature = "DKIM-Signature";
auto constexpr Date           = "Date";
auto constexpr From           = "From";
auto constexpr Message_ID     = "Message-ID";
auto constexpr Subject        = "Subject";
auto constexpr To             = "To";

struct header {
  header(std::string_view n, std::string_view v, std::string_view f)
    : name(n)
    , value(v)
    , field(f)
  {
  }

  std::string as_string() const { return std::string(field); }

  // The whole field: name, anything up to the colon, value including
  // folding, but not the line ending that terminates it.
  std::string_view as_view() const { return field; }

  bool operator==(std::string_view n) const { return iequal(n, name); }

  std::string_view name;
  std::string_view value;
  std::string_view field;
};

struct parsed {
  bool parse(std::string_view input);

  std::string as_string() const;

  // First header of that name with surrounding white space trimmed,
  // or empty.
  std::string_view get_header(std::string_view name) const;

  // Indices into headers, top of the message first.
  std::vector<size_t> find_all(std::string_view name) const;

  std::vector<header> headers;

  std::string_view body;

  // parser state
  std::string_view field_name;
  std::string_view field_value;
};

} // namespace message

#endif // MESSAGE_DOT_HPP_INCLUDED
