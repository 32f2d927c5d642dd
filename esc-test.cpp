#include "esc.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK_EQ(esc("From: a\r\n\tb"), "From: a\\r\\n\\tb");
  CHECK_EQ(esc("\x01\xa0\\"), "\\x01\\xa0\\\\");

  auto const s1 = "no characters to escape";
  CHECK_EQ(esc(s1), s1);

  CHECK_EQ(esc("a\r\nb\r\n", esc_line_option::multi), "a\\r\\n\nb\\r\\n");
  CHECK_EQ(esc(""), "");
}
