#include "DKIM-resolver.hpp"

#include "DKIM-memory-resolver.hpp"

#include <chrono>
#include <type_traits>

#include <glog/logging.h>

using namespace std::chrono_literals;

using DKIM::key_resolver;
using DKIM::status;

// Holds a reference to its txt_resolver, so no temporaries.
static_assert(std::is_constructible_v<key_resolver, DKIM::memory_resolver const&>);
static_assert(!std::is_constructible_v<key_resolver, DKIM::memory_resolver>);

int main(int argc, char* argv[])
{
  CHECK_EQ(key_resolver::query_name("brisbane", "Example.COM"),
           "brisbane._domainkey.Example.COM");

  DKIM::memory_resolver dns;

  dns.add("good._domainkey.example.com", "v=DKIM1; k=rsa; p=MTIz");

  // Long keys arrive split into several character-strings.
  dns.add("split._domainkey.example.com",
          std::vector<std::string>{"v=DKIM1; k=ed25519; p=MTIz", "NDU2"});

  dns.add("revoked._domainkey.example.com", "v=DKIM1; p=");
  dns.add("garbage._domainkey.example.com", "this is not a key");
  dns.fail("broken._domainkey.example.com", "SERVFAIL");

  // Two records, the first one is used.
  dns.add("two._domainkey.example.com", "p=Zmlyc3Q=");
  dns.add("two._domainkey.example.com", "p=c2Vjb25k");

  // The first one is bad, we don't go looking for a better one.
  dns.add("badfirst._domainkey.example.com", "p=!!!!");
  dns.add("badfirst._domainkey.example.com", "p=MTIz");

  key_resolver const res(dns);

  auto const good = res.resolve("good", "example.com", 1s);
  CHECK(good.st == status::pass);
  CHECK_EQ(good.key.public_key(), "123");

  auto const split = res.resolve("split", "example.com", 1s);
  CHECK(split.st == status::pass);
  CHECK(split.key.key() == DKIM::key_type::ed25519);
  CHECK_EQ(split.key.public_key(), "123456");

  CHECK(res.resolve("revoked", "example.com", 1s).st == status::key_revoked);
  CHECK(res.resolve("garbage", "example.com", 1s).st == status::key_malformed);
  CHECK(res.resolve("missing", "example.com", 1s).st == status::no_key);

  auto const broken = res.resolve("broken", "example.com", 1s);
  CHECK(broken.st == status::dns_failure);
  CHECK(DKIM::retryable(broken.st));
  CHECK_NE(broken.detail.find("SERVFAIL"), std::string::npos);

  static_assert(key_resolver::selected_record == 0);
  CHECK_EQ(res.resolve("two", "example.com", 1s).key.public_key(), "first");
  CHECK(res.resolve("badfirst", "example.com", 1s).st ==
        status::key_malformed);

  // The timeout goes down to the lookup, which gives up after it.
  dns.add("slow._domainkey.example.com", "v=DKIM1; k=rsa; p=MTIz");
  dns.delay("slow._domainkey.example.com", 20ms);
  CHECK(res.resolve("slow", "example.com", 1s).st == status::pass);

  dns.add("stuck._domainkey.example.com", "v=DKIM1; k=rsa; p=MTIz");
  dns.delay("stuck._domainkey.example.com", 60s);
  auto const start = std::chrono::steady_clock::now();
  auto const stuck = res.resolve("stuck", "example.com", 10ms);
  CHECK(stuck.st == status::dns_failure);
  CHECK_NE(stuck.detail.find("timed out"), std::string::npos);
  CHECK(std::chrono::steady_clock::now() - start < 30s);

  // Several lookups in flight at once.
  auto f1 = res.resolve_async("good", "example.com", 1s);
  auto f2 = res.resolve_async("revoked", "example.com", 1s);
  auto f3 = res.resolve_async("split", "example.com", 1s);
  CHECK(f1.get().st == status::pass);
  CHECK(f2.get().st == status::key_revoked);
  CHECK(f3.get().st == status::pass);
}
