#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

#include "forwarder/nullifier_ledger.hpp"
#include "host/environment.hpp"
#include "primitives/hash.hpp"
#include "tests/unit/util/forwarder_fixture.hpp"

int main() {
  using namespace wrapfwd;
  using test::MakeHash;

  host::Environment env;
  forwarder::NullifierLedger ledger(env);

  ledger.AddNullifier(MakeHash(1));
  if (!ledger.IsContained(MakeHash(1)) || ledger.IsContained(MakeHash(2)) || ledger.Size() != 1) {
    std::cerr << "ledger membership wrong after first insert\n";
    return EXIT_FAILURE;
  }
  if (!test::ExpectError(
          host::ErrorCode::kPreExistingNullifier, [&] { ledger.AddNullifier(MakeHash(1)); },
          "duplicate nullifier")) {
    return EXIT_FAILURE;
  }

  // Inserts made by a call that later fails are undone with it.
  try {
    env.Invoke(test::MakeAddress(1), [&] {
      ledger.AddNullifier(MakeHash(2));
      throw std::runtime_error("later step failed");
    });
  } catch (const std::runtime_error&) {
  }
  if (ledger.IsContained(MakeHash(2)) || ledger.Size() != 1) {
    std::cerr << "failed call left its nullifier behind\n";
    return EXIT_FAILURE;
  }

  env.Invoke(test::MakeAddress(1), [&] { ledger.AddNullifier(MakeHash(2)); });
  std::size_t visited = 0;
  ledger.ForEach([&](const primitives::Hash256&) {
    ++visited;
    return true;
  });
  if (visited != 2) {
    std::cerr << "ForEach visited " << visited << " nullifiers\n";
    return EXIT_FAILURE;
  }

  // Nullifiers that differ only in their trailing bytes, including pairs
  // such as ...01 00 and ...00 83 that a byte-wise multiply-xor folds
  // together, must all land on distinct hash values.
  const primitives::Hash256Hasher hasher;
  std::unordered_set<std::size_t> hashes;
  std::unordered_set<std::size_t> buckets;
  for (unsigned hi = 0; hi < 256; ++hi) {
    for (unsigned lo = 0; lo < 256; ++lo) {
      auto nullifier = MakeHash(0x5A);
      nullifier[30] = static_cast<std::uint8_t>(hi);
      nullifier[31] = static_cast<std::uint8_t>(lo);
      const auto value = hasher(nullifier);
      hashes.insert(value);
      buckets.insert(value % 1024);
    }
  }
  if (hashes.size() != 256 * 256 || buckets.size() < 1000) {
    std::cerr << "crafted nullifiers collide: " << hashes.size() << " hashes, " << buckets.size()
              << " buckets\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
