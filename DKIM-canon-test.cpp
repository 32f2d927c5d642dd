#include "DKIM-canon.hpp"

#include <glog/logging.h>

using DKIM::canon_alg;
using DKIM::canon_body;
using DKIM::canon_header;
using DKIM::line_ending;

int main(int argc, char* argv[])
{
  // Relaxed header: name lower-cased, folding collapsed, trailing WSP gone.
  CHECK_EQ(canon_header(canon_alg::relaxed, "X:  a\r\n  b  \r\n"),
           "x:a b\r\n");
  CHECK_EQ(canon_header(canon_alg::relaxed, "X:  a\r\n  b  "), "x:a b\r\n");
  CHECK_EQ(canon_header(canon_alg::relaxed, "SubJect \t:\tHello   World "),
           "subject:Hello World\r\n");
  CHECK_EQ(canon_header(canon_alg::relaxed, "To:"), "to:\r\n");
  CHECK_EQ(canon_header(canon_alg::relaxed, "Subject: a\n\tb", line_ending::lf_or_crlf),
           "subject:a b\r\n");

  // RFC 6376 section 3.4.5 examples
  CHECK_EQ(canon_header(canon_alg::relaxed, "A: X"), "a:X\r\n");
  CHECK_EQ(canon_header(canon_alg::relaxed, "B : Y\t\r\n\tZ  "), "b:Y Z\r\n");

  // Simple header: exactly as received plus CRLF.
  CHECK_EQ(canon_header(canon_alg::simple, "A: X"), "A: X\r\n");
  CHECK_EQ(canon_header(canon_alg::simple, "B : Y\t\r\n\tZ  "),
           "B : Y\t\r\n\tZ  \r\n");
  CHECK_EQ(canon_header(canon_alg::simple, "B : Y\t\r\n\tZ  \r\n"),
           "B : Y\t\r\n\tZ  \r\n");

  // A bare LF fold becomes CRLF only when LF counts as a line ending.
  CHECK_EQ(canon_header(canon_alg::simple, "B: Y\n Z", line_ending::lf_or_crlf),
           "B: Y\r\n Z\r\n");
  CHECK_EQ(canon_header(canon_alg::simple, "B: Y\n Z", line_ending::crlf),
           "B: Y\n Z\r\n");

  // Empty bodies.
  CHECK_EQ(canon_body(canon_alg::simple, ""), "\r\n");
  CHECK_EQ(canon_body(canon_alg::relaxed, ""), "");
  CHECK_EQ(canon_body(canon_alg::simple, "\r\n\r\n\r\n"), "\r\n");
  CHECK_EQ(canon_body(canon_alg::relaxed, "\r\n \t\r\n"), "");

  // RFC 6376 section 3.4.5 body example.
  auto const body = " C \r\nD \t E\r\n\r\n\r\n";
  CHECK_EQ(canon_body(canon_alg::relaxed, body), " C\r\nD E\r\n");
  CHECK_EQ(canon_body(canon_alg::simple, body), " C \r\nD \t E\r\n");

  // Missing final line ending is added.
  CHECK_EQ(canon_body(canon_alg::simple, "Hi"), "Hi\r\n");
  CHECK_EQ(canon_body(canon_alg::relaxed, "Hi  "), "Hi\r\n");

  // Bare LF handling is a configuration choice.
  CHECK_EQ(canon_body(canon_alg::simple, "a\nb\n\n", line_ending::lf_or_crlf),
           "a\r\nb\r\n");
  CHECK_EQ(canon_body(canon_alg::simple, "a\nb\n\n", line_ending::crlf),
           "a\nb\n\n\r\n");

  // Octets are opaque.
  CHECK_EQ(canon_body(canon_alg::relaxed, "\xff\xfe  x\r\n"), "\xff\xfe x\r\n");
}
