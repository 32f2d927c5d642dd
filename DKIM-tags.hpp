#ifndef DKIM_TAGS_DOT_HPP
#define DKIM_TAGS_DOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// RFC 6376 section 3.2 tag=value lists, shared by the DKIM-Signature
// header field and the key records published in DNS.

namespace DKIM {

struct tag {
  std::string_view name;
  std::string_view value; // raw, may contain FWS
  std::string_view spec;  // the whole tag-spec, surrounding FWS included
};

class tag_list {
public:
  // False on a syntax error; tags then holds what was parsed so far.
  bool parse(std::string_view input);

  // First occurrence wins, later duplicates are ignored.
  std::optional<std::string_view> find(std::string_view name) const;

  std::vector<tag> const& tags() const { return tags_; }
  std::vector<std::string_view> const& duplicates() const { return dups_; }

  // Parser state.
  std::string_view tag_name;
  std::string_view tag_value;
  void             add(std::string_view spec);

private:
  std::vector<tag>              tags_;
  std::vector<std::string_view> dups_;
};

// Remove all FWS from a tag value.
std::string strip_fws(std::string_view value);

// Split a colon separated value (h= in signatures and keys, s= in keys)
// into its white space stripped, non-empty elements.
std::vector<std::string> split_colon_list(std::string_view value);

// Delete the value of the b= tag from a DKIM-Signature header field (or
// its value), leaving every other octet as it was.  The deleted span
// runs from just after the '=' to the next ';' or the end of the input.
// Returns nothing if there is no parsable b= tag.
std::optional<std::string> remove_b_value(std::string_view field);

} // namespace DKIM

#endif // DKIM_TAGS_DOT_HPP
