#include "DKIM.hpp"
#include "DNS-ldns.hpp"
#include "message.hpp"

#include <filesystem>
#include <iostream>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/iostreams/device/mapped_file.hpp>

namespace fs = std::filesystem;

DEFINE_int32(dns_timeout, 5000, "milliseconds to wait for a key record");
DEFINE_uint64(max_signatures, 10, "DKIM-Signature fields to check per message");
DEFINE_bool(crlf, false, "messages use CRLF line endings only");

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("dkimverify message-file...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  DNS_ldns::TXT_resolver const dns;
  DKIM::key_resolver const     keys(dns);

  DKIM::Verify::options opts;
  opts.dns_timeout    = std::chrono::milliseconds(FLAGS_dns_timeout);
  opts.max_signatures = FLAGS_max_signatures;
  if (FLAGS_crlf)
    opts.eol = DKIM::line_ending::crlf;

  DKIM::Verify const dkv(keys, opts);

  auto all_pass = true;

  for (int a = 1; a < argc; ++a) {
    if (!fs::exists(argv[a]))
      LOG(FATAL) << "can't find mail file " << argv[a];
    boost::iostreams::mapped_file_source file;
    file.open(argv[a]);
    message::parsed msg;
    CHECK(msg.parse(std::string_view(file.data(), file.size())))
        << "failed to parse message " << argv[a];

    auto const results = dkv.check(msg);
    if (results.empty()) {
      std::cout << argv[a] << ": dkim=none\n";
      all_pass = false;
    }
    for (auto const& res : results) {
      std::cout << argv[a] << ": " << res.as_ar();
      if (res.testing)
        std::cout << " (testing)";
      std::cout << '\n';
      all_pass = all_pass && res.passed();
    }
  }

  return all_pass ? 0 : 1;
}
