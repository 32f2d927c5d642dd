#include "DKIM-tags.hpp"

#include "esc.hpp"

#include <algorithm>
#include <iterator>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

#include <glog/logging.h>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

template <typename Input>
static std::string_view make_view(Input const& in)
{
  return std::string_view(in.begin(), std::distance(in.begin(), in.end()));
}

namespace RFC6376 {

// clang-format off

struct FWS              : seq<opt<seq<star<WSP>, eol>>, plus<WSP>> {};

struct ALNUMPUNC        : sor<ALPHA, DIGIT, one<'_'>> {};

// %x21-3A / %x3C-7E, that is VCHAR without ';'
struct VALCHAR          : sor<range<0x21, 0x3A>, range<0x3C, 0x7E>> {};

struct tag_name         : seq<ALPHA, star<ALNUMPUNC>> {};

struct tval             : plus<VALCHAR> {};

struct tag_value        : opt<list<tval, plus<FWS>>> {};

struct tag_spec         : seq<opt<FWS>, tag_name, opt<FWS>, one<'='>,
                              opt<FWS>, tag_value, opt<FWS>> {};

struct tag_list         : seq<list<tag_spec, one<';'>>, opt<one<';'>>,
                              opt<FWS>, eof> {};

// clang-format on

template <typename Rule>
struct tag_action : nothing<Rule> {
};

template <>
struct tag_action<tag_name> {
  template <typename Input>
  static void apply(Input const& in, DKIM::tag_list& tags)
  {
    tags.tag_name = make_view(in);
  }
};

template <>
struct tag_action<tag_value> {
  template <typename Input>
  static void apply(Input const& in, DKIM::tag_list& tags)
  {
    tags.tag_value = make_view(in);
  }
};

template <>
struct tag_action<tag_spec> {
  template <typename Input>
  static void apply(Input const& in, DKIM::tag_list& tags)
  {
    tags.add(make_view(in));
  }
};

} // namespace RFC6376

namespace DKIM {

bool tag_list::parse(std::string_view input)
{
  tags_.clear();
  dups_.clear();
  auto in{memory_input<>(input.data(), input.size(), "tag_list")};
  try {
    return tao::pegtl::parse<RFC6376::tag_list, RFC6376::tag_action>(in,
                                                                     *this);
  }
  catch (parse_error const& e) {
    LOG(WARNING) << e.what();
  }
  return false;
}

void tag_list::add(std::string_view spec)
{
  if (find(tag_name)) {
    LOG(WARNING) << "duplicate tag " << tag_name << "=" << esc(tag_value)
                 << " ignored";
    dups_.push_back(tag_name);
  }
  tags_.push_back(tag{tag_name, tag_value, spec});
}

std::optional<std::string_view> tag_list::find(std::string_view name) const
{
  auto const t = std::find_if(begin(tags_), end(tags_),
                              [name](tag const& t) { return t.name == name; });
  if (t == end(tags_))
    return {};
  return t->value;
}

std::string strip_fws(std::string_view value)
{
  std::string ret;
  ret.reserve(value.size());
  std::copy_if(begin(value), end(value), std::back_inserter(ret), [](char c) {
    return !(c == ' ' || c == '\t' || c == '\r' || c == '\n');
  });
  return ret;
}

std::vector<std::string> split_colon_list(std::string_view value)
{
  std::vector<std::string> elements;
  auto const               stripped = strip_fws(value);
  boost::algorithm::split(elements, stripped, boost::algorithm::is_any_of(":"));
  elements.erase(std::remove_if(begin(elements), end(elements),
                                [](auto const& e) { return e.empty(); }),
                 end(elements));
  return elements;
}

std::optional<std::string> remove_b_value(std::string_view field)
{
  auto value = field;
  // A field name never contains '=', a tag list always does.
  if (auto const colon = field.find(':');
      colon != std::string_view::npos &&
      field.substr(0, colon).find('=') == std::string_view::npos)
    value = field.substr(colon + 1);

  tag_list tags;
  if (!tags.parse(value))
    return {};

  auto const b = std::find_if(begin(tags.tags()), end(tags.tags()),
                              [](tag const& t) { return t.name == "b"; });
  if (b == end(tags.tags()))
    return {};

  auto const eq = b->spec.find('=');
  CHECK_NE(eq, std::string_view::npos);

  auto const cut_begin =
      static_cast<size_t>(b->spec.data() - field.data()) + eq + 1;
  auto const cut_end =
      static_cast<size_t>(b->spec.data() - field.data()) + b->spec.size();

  std::string ret(field.substr(0, cut_begin));
  ret.append(field.substr(cut_end));
  return ret;
}

} // namespace DKIM
