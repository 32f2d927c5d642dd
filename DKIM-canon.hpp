#ifndef DKIM_CANON_DOT_HPP
#define DKIM_CANON_DOT_HPP

#include <string>
#include <string_view>

#include "DKIM-types.hpp"

namespace DKIM {

// RFC 6376 section 3.4.1 and 3.4.2.  The field is the complete header
// field, "Name: value" with any folding, as in message::header::field.
// A line ending at the very end of the field is accepted and ignored.
// The result always ends with CRLF.
std::string canon_header(canon_alg        alg,
                         std::string_view field,
                         line_ending      eol = line_ending::lf_or_crlf);

// RFC 6376 section 3.4.3 and 3.4.4.  Output line endings are CRLF.
// Simple turns an empty body into CRLF, relaxed into nothing.
std::string canon_body(canon_alg        alg,
                       std::string_view body,
                       line_ending      eol = line_ending::lf_or_crlf);

} // namespace DKIM

#endif // DKIM_CANON_DOT_HPP
