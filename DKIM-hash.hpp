#ifndef DKIM_HASH_DOT_HPP
#define DKIM_HASH_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "DKIM-types.hpp"
#include "message.hpp"

namespace DKIM {

// Digest of the canonical body, cut to length octets if given.
std::string body_hash(hash_alg                alg,
                      canon_alg               canon,
                      std::string_view        body,
                      std::optional<uint64_t> length,
                      line_ending             eol);

// Indices into msg.headers for the names of h=, in h= order.  Each
// name picks the next unused field of that name counting up from the
// bottom of the header; a name with none left selects nothing.  The
// field at index exclude, if any, is never selected.
std::vector<std::size_t>
select_headers(message::parsed const&          msg,
               std::vector<std::string> const& names,
               std::optional<std::size_t>      exclude = {});

// The octets that go into the header hash: each selected field
// canonicalized, then the signature field itself (b= value already
// deleted) canonicalized and without its final CRLF.
std::string header_hash_input(message::parsed const&          msg,
                              std::vector<std::string> const& names,
                              canon_alg                       canon,
                              std::string_view                sig_field,
                              line_ending                     eol,
                              std::optional<std::size_t>      exclude = {});

std::string header_hash(hash_alg                        alg,
                        message::parsed const&          msg,
                        std::vector<std::string> const& names,
                        canon_alg                       canon,
                        std::string_view                sig_field,
                        line_ending                     eol,
                        std::optional<std::size_t>      exclude = {});

} // namespace DKIM

#endif // DKIM_HASH_DOT_HPP
