#include "DKIM-hash.hpp"

#include "Base64.hpp"
#include "Hash.hpp"

#include <glog/logging.h>

using DKIM::canon_alg;
using DKIM::hash_alg;
using DKIM::line_ending;

int main(int argc, char* argv[])
{
  auto const crlf = line_ending::crlf;

  // Empty bodies.
  CHECK_EQ(Base64::enc(DKIM::body_hash(hash_alg::sha256, canon_alg::simple,
                                       "", {}, crlf)),
           "frcCV1k9oG9oKj3dpUqdJg1PxRT2RSN/XKdLCPjaYaY=");
  CHECK_EQ(Base64::enc(DKIM::body_hash(hash_alg::sha256, canon_alg::relaxed,
                                       "", {}, crlf)),
           "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
  CHECK_EQ(Base64::enc(DKIM::body_hash(hash_alg::sha1, canon_alg::simple, "",
                                       {}, crlf)),
           "uoq1oCgLlTqpdDX/iUbLy7J1Wic=");

  // RFC 8463 appendix A.3, the body of the example message.
  auto const body = "Hi.\r\n\r\nWe lost the game.  Are you hungry yet?\r\n\r\n"
                    "Joe.";
  CHECK_EQ(Base64::enc(DKIM::body_hash(hash_alg::sha256, canon_alg::relaxed,
                                       body, {}, crlf)),
           "2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVOzv8=");

  // l= counts canonical octets.
  CHECK_EQ(DKIM::body_hash(hash_alg::sha256, canon_alg::simple, "AB\r\n", 1,
                           crlf),
           Hash::digest(hash_alg::sha256, "A"));
  CHECK_EQ(DKIM::body_hash(hash_alg::sha256, canon_alg::simple, "AB\r\n", 0,
                           crlf),
           Hash::digest(hash_alg::sha256, ""));
  // Too large an l= means the whole body.
  CHECK_EQ(DKIM::body_hash(hash_alg::sha256, canon_alg::simple, "AB\r\n",
                           1000, crlf),
           Hash::digest(hash_alg::sha256, "AB\r\n"));
  // Text appended after l= doesn't change the hash.
  CHECK_EQ(DKIM::body_hash(hash_alg::sha256, canon_alg::simple,
                           "AB\r\nappended\r\n", 4, crlf),
           DKIM::body_hash(hash_alg::sha256, canon_alg::simple, "AB\r\n", {},
                           crlf));

  auto const msg_text = "Received: first\r\n"
                        "From: joe@example.com\r\n"
                        "To: jane@example.com\r\n"
                        "DKIM-Signature: v=1; b=xyz\r\n"
                        "Received: second\r\n"
                        "Subject: hello\r\n"
                        "\r\n"
                        "body\r\n";
  message::parsed msg;
  CHECK(msg.parse(msg_text));
  CHECK_EQ(msg.headers.size(), 6);

  // Repeated names count up from the bottom, extra ones select nothing,
  // missing names select nothing.
  std::vector<std::string> const names{"received", "From", "received",
                                       "received", "Cc",   "subject"};
  auto const sel = DKIM::select_headers(msg, names);
  CHECK_EQ(sel.size(), 4);
  CHECK_EQ(sel[0], 4);
  CHECK_EQ(sel[1], 1);
  CHECK_EQ(sel[2], 0);
  CHECK_EQ(sel[3], 5);

  // The signature being verified is never picked, even if h= names it.
  auto const no_sig =
      DKIM::select_headers(msg, {"dkim-signature", "from"}, 3);
  CHECK_EQ(no_sig.size(), 1);
  CHECK_EQ(no_sig[0], 1);

  auto const input = DKIM::header_hash_input(
      msg, {"from", "subject"}, canon_alg::relaxed,
      "DKIM-Signature: v=1;\r\n b=", crlf, 3);
  CHECK_EQ(input, "from:joe@example.com\r\n"
                  "subject:hello\r\n"
                  "dkim-signature:v=1; b=");

  auto const simple_input = DKIM::header_hash_input(
      msg, {"to"}, canon_alg::simple, "DKIM-Signature: v=1;\r\n b=", crlf, 3);
  CHECK_EQ(simple_input, "To: jane@example.com\r\n"
                         "DKIM-Signature: v=1;\r\n b=");

  CHECK_EQ(DKIM::header_hash(hash_alg::sha256, msg, {"to"}, canon_alg::simple,
                             "DKIM-Signature: v=1;\r\n b=", crlf, 3),
           Hash::digest(hash_alg::sha256, simple_input));
}
