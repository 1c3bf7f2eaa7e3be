#include "crypto/pq_engine.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include <oqs/oqs.h>
#include <oqs/rand.h>

#include "crypto/deterministic_rng.hpp"
#include "crypto/pq_params.hpp"
#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace wrapfwd::crypto {

namespace {

constexpr std::string_view kErrSigInit = "Failed to initialize OQS signature context";
constexpr std::string_view kSignatureAlgorithmId = OQS_SIG_alg_ml_dsa_65;

void OqsRandombytesShim(std::uint8_t* out, std::size_t outlen) {
  if (out == nullptr || outlen == 0) {
    return;
  }
  if (auto* rng = DeterministicOqsRng::CurrentInstance()) {
    rng->Generate(out, outlen);
    return;
  }
  util::FillSecureRandomBytesOrAbort(std::span<std::uint8_t>(out, outlen));
}

void EnsureOqsRandombytesHookInstalled() {
  OQS_randombytes_custom_algorithm(&OqsRandombytesShim);
}

class SigContext {
 public:
  explicit SigContext(std::string_view algorithm) {
    handle_ = OQS_SIG_new(std::string(algorithm).c_str());
    if (handle_ == nullptr) {
      throw std::runtime_error(std::string(kErrSigInit));
    }
  }

  ~SigContext() { OQS_SIG_free(handle_); }
  SigContext(const SigContext&) = delete;
  SigContext& operator=(const SigContext&) = delete;
  SigContext(SigContext&&) = delete;
  SigContext& operator=(SigContext&&) = delete;

  OQS_SIG* get() const { return handle_; }

 private:
  OQS_SIG* handle_{nullptr};
};

const OQS_SIG& SignatureContext() {
  static SigContext ctx(kSignatureAlgorithmId);
  const auto* sig = ctx.get();
  if (sig->length_public_key != kMldsa65PublicKeyBytes ||
      sig->length_secret_key != kMldsa65SecretKeyBytes ||
      sig->length_signature != kMldsa65SignatureBytes) {
    throw std::runtime_error("ML-DSA-65 size mismatch (liboqs build is incompatible)");
  }
  return *sig;
}

void EnsureSize(std::span<const std::uint8_t> buffer, std::size_t expected_size,
                std::string_view label) {
  if (buffer.size_bytes() != expected_size) {
    throw std::runtime_error(std::string(label) + " size mismatch");
  }
}

}  // namespace

SigningKey::SigningKey(std::vector<std::uint8_t> secret_key, std::vector<std::uint8_t> public_key)
    : secret_key_(std::move(secret_key)), public_key_(std::move(public_key)) {}

SigningKey::~SigningKey() { util::SecureWipe(secret_key_); }

SigningKey::SigningKey(SigningKey&& other) noexcept = default;

SigningKey& SigningKey::operator=(SigningKey&& other) noexcept = default;

SigningKey SigningKey::Generate() {
  EnsureOqsRandombytesHookInstalled();
  const auto& sig = SignatureContext();
  std::vector<std::uint8_t> public_key(sig.length_public_key);
  std::vector<std::uint8_t> secret_key(sig.length_secret_key);
  if (OQS_SIG_keypair(&sig, public_key.data(), secret_key.data()) != OQS_SUCCESS) {
    throw std::runtime_error("Failed to generate ML-DSA keypair");
  }
  return SigningKey(std::move(secret_key), std::move(public_key));
}

SigningKey SigningKey::Import(std::span<const std::uint8_t> secret_key,
                              std::span<const std::uint8_t> public_key) {
  const auto& sig = SignatureContext();
  EnsureSize(secret_key, sig.length_secret_key, "ML-DSA secret key");
  EnsureSize(public_key, sig.length_public_key, "ML-DSA public key");
  return SigningKey(std::vector<std::uint8_t>(secret_key.begin(), secret_key.end()),
                    std::vector<std::uint8_t>(public_key.begin(), public_key.end()));
}

std::vector<std::uint8_t> SigningKey::Sign(std::span<const std::uint8_t> message) const {
  EnsureOqsRandombytesHookInstalled();
  const auto& sig = SignatureContext();
  EnsureSize(secret_key_, sig.length_secret_key, "ML-DSA secret key");
  std::vector<std::uint8_t> signature(sig.length_signature);
  size_t sig_len = 0;
  if (OQS_SIG_sign(&sig, signature.data(), &sig_len, message.data(), message.size(),
                   secret_key_.data()) != OQS_SUCCESS) {
    throw std::runtime_error("ML-DSA signing failure");
  }
  if (sig_len != signature.size()) {
    throw std::runtime_error("ML-DSA signature size mismatch");
  }
  return signature;
}

std::size_t SignaturePublicKeySize() {
  (void)SignatureContext();
  return kMldsa65PublicKeyBytes;
}

std::size_t SignatureSize() {
  (void)SignatureContext();
  return kMldsa65SignatureBytes;
}

bool VerifySignature(std::span<const std::uint8_t> message,
                     std::span<const std::uint8_t> signature,
                     std::span<const std::uint8_t> public_key) {
  const auto& sig = SignatureContext();
  if (public_key.size() != kMldsa65PublicKeyBytes || signature.size() != kMldsa65SignatureBytes) {
    return false;
  }
  return OQS_SIG_verify(&sig, message.data(), message.size(), signature.data(), signature.size(),
                        public_key.data()) == OQS_SUCCESS;
}

}  // namespace wrapfwd::crypto
