#include "iequal.hpp"

#include <map>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK(iequal("", ""));
  CHECK(!iequal("a", ""));
  CHECK(!iequal("", "b"));

  CHECK(iequal("DKIM-Signature", "dkim-signature"));
  CHECK(!iequal("DKIM-Signature", "DKIM-Signatures"));

  CHECK(istarts_with("DKIM-Signature", "dkim-"));
  CHECK(iends_with("selector._DomainKey.example.com", "EXAMPLE.com"));
  CHECK(!istarts_with("dk", "dkim"));
  CHECK(!iends_with("example.com", "xample.org"));

  CHECK_EQ(to_lower("Message-ID"), "message-id");
  CHECK_EQ(to_lower(""), "");

  std::map<std::string, int, ci_less> hdrs;
  hdrs["From"] = 1;
  hdrs["SUBJECT"] = 2;
  CHECK_EQ(hdrs.count("from"), 1u);
  CHECK_EQ(hdrs.find(std::string_view("Subject"))->second, 2);
  CHECK(hdrs.find("To") == hdrs.end());
}
