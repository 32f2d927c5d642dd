#include "DKIM-tags.hpp"
#include "DKIM.hpp"
#include "message.hpp"

#include <filesystem>
#include <iostream>

#include <gflags/gflags.h>

#include <glog/logging.h>

#include <boost/algorithm/string.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

namespace fs = std::filesystem;

DEFINE_string(selector, "", "DKIM selector, s=");
DEFINE_string(domain, "", "signing domain, d=");
DEFINE_string(key_file, "", "PEM private key, RSA or Ed25519");
DEFINE_string(headers, "", "colon separated header names to sign, h=");
DEFINE_string(canon, "relaxed/relaxed", "canonicalization, header/body");
DEFINE_string(hash, "sha256", "hash algorithm");
DEFINE_string(identity, "", "agent or user identifier, i=");
DEFINE_int64(expire, 0, "seconds until the signature expires, 0 for never");
DEFINE_bool(crlf, false, "message uses CRLF line endings only");

namespace {
DKIM::Sign::options get_options()
{
  DKIM::Sign::options opts;

  auto const hash = DKIM::hash_from(FLAGS_hash);
  if (!hash)
    LOG(FATAL) << "unknown hash algorithm " << FLAGS_hash;
  opts.hash = *hash;

  std::vector<std::string> canons;
  boost::split(canons, FLAGS_canon, boost::is_any_of("/"));
  if (canons.size() > 2)
    LOG(FATAL) << "bad canonicalization " << FLAGS_canon;
  auto const hdr_canon  = DKIM::canon_from(canons[0]);
  auto const body_canon = DKIM::canon_from(canons.size() > 1 ? canons[1] : "simple");
  if (!hdr_canon || !body_canon)
    LOG(FATAL) << "bad canonicalization " << FLAGS_canon;
  opts.header_canon = *hdr_canon;
  opts.body_canon   = *body_canon;

  if (!FLAGS_headers.empty())
    opts.headers = DKIM::split_colon_list(FLAGS_headers);
  if (!FLAGS_identity.empty())
    opts.identity = FLAGS_identity;
  if (FLAGS_expire)
    opts.expire = std::chrono::seconds(FLAGS_expire);
  if (FLAGS_crlf)
    opts.eol = DKIM::line_ending::crlf;

  return opts;
}
} // namespace

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("dkimsign --selector=s --domain=d --key_file=k "
                          "message-file...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (!fs::exists(FLAGS_key_file))
    LOG(FATAL) << "can't find key file «" << FLAGS_key_file << "»";

  boost::iostreams::mapped_file_source priv;
  priv.open(FLAGS_key_file);

  try {
    auto const key =
        DKIM::private_key::from_pem(std::string_view(priv.data(), priv.size()));

    DKIM::Sign const signer(key, FLAGS_selector, FLAGS_domain, get_options());

    for (int a = 1; a < argc; ++a) {
      if (!fs::exists(argv[a]))
        LOG(FATAL) << "can't find mail file " << argv[a];
      boost::iostreams::mapped_file_source file;
      file.open(argv[a]);
      message::parsed msg;
      CHECK(msg.parse(std::string_view(file.data(), file.size())))
          << "failed to parse message " << argv[a];

      std::cout << signer.sign(msg) << "\r\n"
                << std::string_view(file.data(), file.size());
    }
  }
  catch (DKIM::error const& e) {
    LOG(ERROR) << DKIM::c_str(e.code()) << ": " << e.what();
    return 1;
  }
}
