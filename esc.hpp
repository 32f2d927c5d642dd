#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <string>
#include <string_view>

// Make raw header or body octets safe for a log line.  With multi, a
// newline is kept after each escaped "\n" so folded fields stay
// readable.

enum class esc_line_option : bool { single, multi };

std::string esc(std::string_view str,
                esc_line_option  line_option = esc_line_option::single);

#endif // ESC_DOT_HPP
