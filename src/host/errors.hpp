#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace wrapfwd::host {

enum class ErrorCategory {
  kAccess,
  kAccounting,
  kState,
  kMigration,
  kDecoding,
  kPermit,
  kHost,
};

enum class ErrorCode {
  // Access
  kUnauthorizedCaller,
  kUnauthorizedLogicRef,
  kZeroNotAllowed,
  kReentrantCall,
  // Accounting
  kBalanceMismatch,
  kAmountOverflow,
  kTransferFailed,
  kInsufficientBalance,
  kInsufficientAllowance,
  // State
  kPreExistingNullifier,
  kResourceAlreadyConsumed,
  kEmergencyCallerAlreadySet,
  kProtocolAdapterNotStopped,
  // Migration integrity
  kInvalidMigrationCommitmentTreeRoot,
  kInvalidMigrationLogicRef,
  kInvalidForwarder,
  // Decoding
  kInvalidCallType,
  kInvalidInputLength,
  kInvalidAddressEncoding,
  // Permit
  kSignatureExpired,
  kInvalidNonce,
  kInvalidAmount,
  kInvalidSigner,
  kInvalidSignatureLength,
  // Host
  kUnknownAccount,
  kAccountExists,
};

std::string_view ErrorCodeName(ErrorCode code);
ErrorCategory ErrorCategoryOf(ErrorCode code);
std::string_view ErrorCategoryName(ErrorCategory category);

// Aborts the current call. `Expected()`/`Actual()` carry the diagnostic
// parameters (0x-hex for hashes and addresses, decimal for amounts) and are
// empty when the error has none.
class ForwarderError : public std::runtime_error {
 public:
  explicit ForwarderError(ErrorCode code, std::string expected = {}, std::string actual = {});

  ErrorCode Code() const noexcept { return code_; }
  ErrorCategory Category() const noexcept { return ErrorCategoryOf(code_); }
  const std::string& Expected() const noexcept { return expected_; }
  const std::string& Actual() const noexcept { return actual_; }

 private:
  ErrorCode code_;
  std::string expected_;
  std::string actual_;
};

}  // namespace wrapfwd::host
