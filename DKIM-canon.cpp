#include "DKIM-canon.hpp"

#include "iequal.hpp"

#include <glog/logging.h>

namespace {
auto constexpr CRLF = "\r\n";

constexpr bool is_wsp(char c) { return c == ' ' || c == '\t'; }

// Length of the line ending at the front of s, zero if there is none.
size_t eol_len(std::string_view s, DKIM::line_ending eol)
{
  if (s.size() >= 2 && s[0] == '\r' && s[1] == '\n')
    return 2;
  if (eol == DKIM::line_ending::lf_or_crlf && !s.empty() && s[0] == '\n')
    return 1;
  return 0;
}

// Split off the next line, without its ending.
std::string_view next_line(std::string_view& in, DKIM::line_ending eol)
{
  for (size_t i = 0; i < in.size(); ++i) {
    if (auto const n = eol_len(in.substr(i), eol); n) {
      auto const line = in.substr(0, i);
      in.remove_prefix(i + n);
      return line;
    }
  }
  auto const line = in;
  in = {};
  return line;
}

std::string_view strip_trailing_eol(std::string_view s, DKIM::line_ending eol)
{
  if (s.size() >= 2 && s.substr(s.size() - 2) == CRLF)
    s.remove_suffix(2);
  else if (eol == DKIM::line_ending::lf_or_crlf && !s.empty() &&
           s.back() == '\n')
    s.remove_suffix(1);
  return s;
}

// Collapse each run of WSP into one SP, and drop WSP at either end.
std::string compress_wsp(std::string_view s)
{
  std::string ret;
  ret.reserve(s.size());
  bool pending = false;
  for (auto c : s) {
    if (is_wsp(c)) {
      pending = true;
      continue;
    }
    if (pending && !ret.empty())
      ret += ' ';
    pending = false;
    ret += c;
  }
  return ret;
}

void remove_trailing_empty_lines(std::string& out)
{
  auto constexpr empty_line = "\r\n\r\n";
  while (out.size() >= 4 && out.compare(out.size() - 4, 4, empty_line) == 0)
    out.resize(out.size() - 2);
}
} // namespace

namespace DKIM {

std::string canon_header(canon_alg alg, std::string_view field, line_ending eol)
{
  field = strip_trailing_eol(field, eol);

  if (alg == canon_alg::simple) {
    std::string ret;
    ret.reserve(field.size() + 2);
    while (!field.empty()) {
      auto const line = next_line(field, eol);
      ret.append(line.data(), line.size());
      if (!field.empty())
        ret += CRLF;
    }
    ret += CRLF;
    return ret;
  }

  auto const colon = field.find(':');
  auto       name = field.substr(0, colon);
  while (!name.empty() && is_wsp(name.back()))
    name.remove_suffix(1);

  std::string unfolded;
  if (colon != std::string_view::npos) {
    auto value = field.substr(colon + 1);
    unfolded.reserve(value.size());
    while (!value.empty()) {
      auto const line = next_line(value, eol);
      unfolded.append(line.data(), line.size());
    }
  }

  std::string ret = to_lower(name);
  ret += ':';
  ret += compress_wsp(unfolded);
  ret += CRLF;
  return ret;
}

std::string canon_body(canon_alg alg, std::string_view body, line_ending eol)
{
  std::string out;
  out.reserve(body.size() + 2);

  while (!body.empty()) {
    auto const line = next_line(body, eol);
    if (alg == canon_alg::simple) {
      out.append(line.data(), line.size());
    }
    else {
      auto const compressed = compress_wsp(line);
      // compress_wsp() also drops leading WSP; relaxed keeps it as one SP.
      if (!line.empty() && is_wsp(line.front()) && !compressed.empty())
        out += ' ';
      out += compressed;
    }
    out += CRLF;
  }

  remove_trailing_empty_lines(out);

  if (out == CRLF) {
    if (alg == canon_alg::relaxed)
      out.clear();
  }
  else if (out.empty() && alg == canon_alg::simple) {
    out = CRLF;
  }

  return out;
}

} // namespace DKIM
