#ifndef IEQUAL_DOT_HPP
#define IEQUAL_DOT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

// ASCII only, the C locale is all that header field names and DKIM
// tag values ever need.

inline char lower_char(char c)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool iequal_char(char a, char b) { return lower_char(a) == lower_char(b); }

inline bool iequal(std::string_view a, std::string_view b)
{
  return (size(a) == size(b)) &&
         std::equal(begin(b), end(b), begin(a), iequal_char);
}

inline bool iless(std::string_view a, std::string_view b)
{
  return std::lexicographical_compare(
      begin(a), end(a), begin(b), end(b),
      [](char x, char y) { return lower_char(x) < lower_char(y); });
}

inline bool istarts_with(std::string_view str, std::string_view prefix)
{
  return (str.size() >= prefix.size()) &&
         iequal(str.substr(0, prefix.size()), prefix);
}

inline bool iends_with(std::string_view str, std::string_view suffix)
{
  return (str.size() >= suffix.size()) &&
         iequal(str.substr(str.size() - suffix.size()), suffix);
}

inline std::string to_lower(std::string_view str)
{
  std::string ret(str);
  std::transform(begin(ret), end(ret), begin(ret), lower_char);
  return ret;
}

// Header field names, grouped for the h= countdown.
struct ci_less {
  using is_transparent = void;

  bool operator()(std::string_view a, std::string_view b) const
  {
    return iless(a, b);
  }
};

#endif // IEQUAL_DOT_HPP
