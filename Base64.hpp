#ifndef BASE64_DOT_HPP
#define BASE64_DOT_HPP

#include <string>
#include <string_view>

// RFC 4648 section 4 base64, as carried in the DKIM b=, bh= and p=
// tags.

namespace Base64 {

// No line breaks; DKIM-sig folds b= itself.
std::string enc(std::string_view in);

// Folding white space (SP, HTAB, CR, LF) is ignored anywhere in the
// input.  Throws std::invalid_argument for anything else that is not
// part of the alphabet, misplaced padding, or a truncated final group.
std::string dec(std::string_view in);

bool is_valid(std::string_view in);

} // namespace Base64

#endif // BASE64_DOT_HPP
