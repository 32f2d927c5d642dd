#include "DNS-ldns.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(lookup, "", "key record name to look up live, for example "
                          "google._domainkey.gmail.com");

int main(int argc, char* argv[])
{
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  DNS_ldns::Domain const dom("sel._domainkey.example.com");
  CHECK_EQ(dom.str(), "sel._domainkey.example.com");
  CHECK_NOTNULL(dom.get());

  // A label longer than 63 octets.
  auto const long_label = std::string(64, 'a') + ".example.com";
  auto threw            = false;
  try {
    DNS_ldns::Domain const bad(long_label);
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  // Can't be a name, so no resolver needs to answer.
  DNS_ldns::TXT_resolver const dns;
  auto const answer = dns.lookup_txt(long_label, std::chrono::milliseconds(100));
  CHECK(answer.status != DKIM::lookup_status::ok);
  CHECK(answer.records.empty());

  if (!FLAGS_lookup.empty()) {
    auto const live = dns.lookup_txt(FLAGS_lookup, std::chrono::seconds(5));
    std::cout << FLAGS_lookup << " status " << static_cast<int>(live.status)
              << ' ' << live.detail << '\n';
    for (auto const& rr : live.records) {
      for (auto const& s : rr)
        std::cout << '"' << s << "\" ";
      std::cout << '\n';
    }
  }
}
