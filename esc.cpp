#include "esc.hpp"

#include <cctype>
#include <iterator>

#include <fmt/format.h>

std::string esc(std::string_view str, esc_line_option line_option)
{
  std::string ret;
  ret.reserve(str.length());

  for (unsigned char c : str) {
    switch (c) { // clang-format off
    case '\t': ret += "\\t";  break;
    case '\r': ret += "\\r";  break;
    case '\\': ret += "\\\\"; break;
    case '\n':
      ret += "\\n";
      if (line_option == esc_line_option::multi)
        ret += '\n';
      break;
    // clang-format on
    default:
      if (std::isprint(c))
        ret += static_cast<char>(c);
      else
        fmt::format_to(std::back_inserter(ret), "\\x{:02x}", c);
      break;
    }
  }

  if ((line_option == esc_line_option::multi) && !ret.empty() &&
      (ret.back() == '\n')) {
    ret.pop_back();
  }

  return ret;
}
