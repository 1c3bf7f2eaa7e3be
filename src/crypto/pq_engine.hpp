#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace wrapfwd::crypto {

// ML-DSA-65 key pair held by a permit owner. Only used off the call path
// (signing); verification goes through VerifySignature.
class SigningKey {
 public:
  SigningKey() = default;
  ~SigningKey();
  SigningKey(const SigningKey&) = delete;
  SigningKey& operator=(const SigningKey&) = delete;
  SigningKey(SigningKey&&) noexcept;
  SigningKey& operator=(SigningKey&&) noexcept;

  static SigningKey Generate();
  static SigningKey Import(std::span<const std::uint8_t> secret_key,
                           std::span<const std::uint8_t> public_key);

  std::vector<std::uint8_t> Sign(std::span<const std::uint8_t> message) const;

  std::span<const std::uint8_t> PublicKey() const noexcept { return public_key_; }

 private:
  SigningKey(std::vector<std::uint8_t> secret_key, std::vector<std::uint8_t> public_key);

  std::vector<std::uint8_t> secret_key_;
  std::vector<std::uint8_t> public_key_;
};

std::size_t SignaturePublicKeySize();
std::size_t SignatureSize();

// False on malformed sizes or a failed check; never throws for bad input.
bool VerifySignature(std::span<const std::uint8_t> message,
                     std::span<const std::uint8_t> signature,
                     std::span<const std::uint8_t> public_key);

}  // namespace wrapfwd::crypto
