#include "message.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

#include <glog/logging.h>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

static std::string_view trim(std::string_view v)
{
  auto constexpr WS = " \t\r\n";
  v.remove_prefix(std::min(v.find_first_not_of(WS), v.size()));
  v.remove_suffix(std::min(v.size() - v.find_last_not_of(WS) - 1, v.size()));
  return v;
}

template <typename Input>
static std::string_view make_view(Input const& in)
{
  return std::string_view(in.begin(), std::distance(in.begin(), in.end()));
}

namespace RFC5322 {

// clang-format off

struct ftext            : ranges<33, 57, 59, 126> {};

struct field_name       : plus<ftext> {};

// Any octet but CR and LF, or a CR that is not the start of a line ending.
struct text             : sor<not_one<'\r', '\n'>,
                              seq<one<'\r'>, not_at<one<'\n'>>>> {};

// A line ending followed by WSP continues the field.
struct fold             : seq<eol, at<WSP>> {};

struct field_value      : star<sor<text, fold>> {};

// Tolerate obs-optional WSP between the name and the colon.
struct field            : seq<field_name, star<WSP>, one<':'>, field_value,
                              sor<eol, at<eof>>> {};

struct fields           : star<field> {};

struct body             : until<eof> {};

struct message          : seq<fields, opt<seq<eol, body>>, eof> {};

// clang-format on

template <typename Rule>
struct msg_action : nothing<Rule> {
};

template <>
struct msg_action<field_name> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.field_name = make_view(in);
  }
};

template <>
struct msg_action<field_value> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.field_value = make_view(in);
  }
};

template <>
struct msg_action<field> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    auto const begin = msg.field_name.data();
    auto const end = msg.field_value.data() + msg.field_value.size();
    msg.headers.emplace_back(
        msg.field_name, msg.field_value,
        std::string_view(begin, static_cast<size_t>(end - begin)));
  }
};

template <>
struct msg_action<body> {
  template <typename Input>
  static void apply(Input const& in, ::message::parsed& msg)
  {
    msg.body = make_view(in);
  }
};

} // namespace RFC5322

namespace message {

bool parsed::parse(std::string_view input)
{
  headers.clear();
  body = {};
  auto in{memory_input<>(input.data(), input.size(), "message")};
  if (!tao::pegtl::parse<RFC5322::message, RFC5322::msg_action>(in, *this)) {
    LOG(WARNING) << "message failed to parse after " << headers.size()
                 << " header fields";
    return false;
  }
  return true;
}

std::string parsed::as_string() const
{
  fmt::memory_buffer bfr;

  for (auto const& h : headers)
    fmt::format_to(std::back_inserter(bfr), "{}\r\n", h.as_view());

  if (!body.empty())
    fmt::format_to(std::back_inserter(bfr), "\r\n{}", body);

  return fmt::to_string(bfr);
}

std::string_view parsed::get_header(std::string_view name) const
{
  if (auto hdr = std::find(begin(headers), end(headers), name);
      hdr != end(headers)) {
    return trim(hdr->value);
  }
  return "";
}

std::vector<size_t> parsed::find_all(std::string_view name) const
{
  std::vector<size_t> ret;
  for (size_t i = 0; i < headers.size(); ++i) {
    if (headers[i] == name)
      ret.push_back(i);
  }
  return ret;
}

} // namespace message
