#include "DKIM-tags.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  DKIM::tag_list tags;

  CHECK(tags.parse("v=1; a=rsa-sha256; d=example.com"));
  CHECK_EQ(tags.tags().size(), 3);
  CHECK_EQ(*tags.find("v"), "1");
  CHECK_EQ(*tags.find("a"), "rsa-sha256");
  CHECK_EQ(*tags.find("d"), "example.com");
  CHECK(!tags.find("s"));

  // Trailing semicolon, surrounding FWS, empty values.
  CHECK(tags.parse(" v = 1 ;\r\n\tp= ; "));
  CHECK_EQ(*tags.find("v"), "1");
  CHECK_EQ(*tags.find("p"), "");

  // Values may be folded, the raw value keeps the folding.
  CHECK(tags.parse("h=from:to:\r\n\tsubject; b=abc\r\n def"));
  CHECK_EQ(*tags.find("h"), "from:to:\r\n\tsubject");
  CHECK_EQ(*tags.find("b"), "abc\r\n def");
  CHECK_EQ(DKIM::strip_fws(*tags.find("b")), "abcdef");

  // Names are case sensitive.
  CHECK(tags.parse("V=1"));
  CHECK(!tags.find("v"));

  // First occurrence wins.
  CHECK(tags.parse("d=first.example; d=second.example"));
  CHECK_EQ(*tags.find("d"), "first.example");
  CHECK_EQ(tags.duplicates().size(), 1);
  CHECK_EQ(tags.duplicates()[0], "d");

  // Syntax errors.
  CHECK(!tags.parse("v=1; bogus"));
  CHECK(!tags.parse("=1"));
  CHECK(!tags.parse("1v=1"));
  CHECK(!tags.parse("v=1;; d=x"));
  CHECK(!tags.parse("v=1\r\n\r\n d=x"));

  // Colon lists.
  auto const h = DKIM::split_colon_list(" From : To:\r\n\tSubject:");
  CHECK_EQ(h.size(), 3);
  CHECK_EQ(h[0], "From");
  CHECK_EQ(h[1], "To");
  CHECK_EQ(h[2], "Subject");

  CHECK(DKIM::split_colon_list("").empty());

  // b= removal keeps bh= and everything else intact.
  auto const field = "DKIM-Signature: v=1; bh=MTIz; b=dGhp\r\n\tcyBpcw==; "
                     "d=example.com";
  auto const stripped = DKIM::remove_b_value(field);
  CHECK(stripped);
  CHECK_EQ(*stripped, "DKIM-Signature: v=1; bh=MTIz; b=; d=example.com");

  // b= at the end, trailing FWS belongs to the value.
  auto const last = DKIM::remove_b_value("v=1; bh=MTIz; b=dGhp \r\n\tcyBp ");
  CHECK(last);
  CHECK_EQ(*last, "v=1; bh=MTIz; b=");

  // Folding before the '=' survives.
  auto const folded = DKIM::remove_b_value("v=1;\r\n\tb =\r\n\tdGhp;");
  CHECK(folded);
  CHECK_EQ(*folded, "v=1;\r\n\tb =;");

  CHECK(!DKIM::remove_b_value("v=1; bh=MTIz"));
  CHECK(!DKIM::remove_b_value("v=1; b=x; bogus"));
}
