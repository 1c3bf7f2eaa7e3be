#include "host/errors.hpp"

namespace wrapfwd::host {

namespace {

std::string FormatMessage(ErrorCode code, const std::string& expected, const std::string& actual) {
  std::string message(ErrorCodeName(code));
  if (!expected.empty() || !actual.empty()) {
    message += "(expected=" + expected + ", actual=" + actual + ")";
  }
  return message;
}

}  // namespace

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnauthorizedCaller:
      return "UnauthorizedCaller";
    case ErrorCode::kUnauthorizedLogicRef:
      return "UnauthorizedLogicRef";
    case ErrorCode::kZeroNotAllowed:
      return "ZeroNotAllowed";
    case ErrorCode::kReentrantCall:
      return "ReentrantCall";
    case ErrorCode::kBalanceMismatch:
      return "BalanceMismatch";
    case ErrorCode::kAmountOverflow:
      return "AmountOverflow";
    case ErrorCode::kTransferFailed:
      return "TransferFailed";
    case ErrorCode::kInsufficientBalance:
      return "InsufficientBalance";
    case ErrorCode::kInsufficientAllowance:
      return "InsufficientAllowance";
    case ErrorCode::kPreExistingNullifier:
      return "PreExistingNullifier";
    case ErrorCode::kResourceAlreadyConsumed:
      return "ResourceAlreadyConsumed";
    case ErrorCode::kEmergencyCallerAlreadySet:
      return "EmergencyCallerAlreadySet";
    case ErrorCode::kProtocolAdapterNotStopped:
      return "ProtocolAdapterNotStopped";
    case ErrorCode::kInvalidMigrationCommitmentTreeRoot:
      return "InvalidMigrationCommitmentTreeRoot";
    case ErrorCode::kInvalidMigrationLogicRef:
      return "InvalidMigrationLogicRef";
    case ErrorCode::kInvalidForwarder:
      return "InvalidForwarder";
    case ErrorCode::kInvalidCallType:
      return "InvalidCallType";
    case ErrorCode::kInvalidInputLength:
      return "InvalidInputLength";
    case ErrorCode::kInvalidAddressEncoding:
      return "InvalidAddressEncoding";
    case ErrorCode::kSignatureExpired:
      return "SignatureExpired";
    case ErrorCode::kInvalidNonce:
      return "InvalidNonce";
    case ErrorCode::kInvalidAmount:
      return "InvalidAmount";
    case ErrorCode::kInvalidSigner:
      return "InvalidSigner";
    case ErrorCode::kInvalidSignatureLength:
      return "InvalidSignatureLength";
    case ErrorCode::kUnknownAccount:
      return "UnknownAccount";
    case ErrorCode::kAccountExists:
      return "AccountExists";
  }
  return "Unknown";
}

ErrorCategory ErrorCategoryOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnauthorizedCaller:
    case ErrorCode::kUnauthorizedLogicRef:
    case ErrorCode::kZeroNotAllowed:
    case ErrorCode::kReentrantCall:
      return ErrorCategory::kAccess;
    case ErrorCode::kBalanceMismatch:
    case ErrorCode::kAmountOverflow:
    case ErrorCode::kTransferFailed:
    case ErrorCode::kInsufficientBalance:
    case ErrorCode::kInsufficientAllowance:
      return ErrorCategory::kAccounting;
    case ErrorCode::kPreExistingNullifier:
    case ErrorCode::kResourceAlreadyConsumed:
    case ErrorCode::kEmergencyCallerAlreadySet:
    case ErrorCode::kProtocolAdapterNotStopped:
      return ErrorCategory::kState;
    case ErrorCode::kInvalidMigrationCommitmentTreeRoot:
    case ErrorCode::kInvalidMigrationLogicRef:
    case ErrorCode::kInvalidForwarder:
      return ErrorCategory::kMigration;
    case ErrorCode::kInvalidCallType:
    case ErrorCode::kInvalidInputLength:
    case ErrorCode::kInvalidAddressEncoding:
      return ErrorCategory::kDecoding;
    case ErrorCode::kSignatureExpired:
    case ErrorCode::kInvalidNonce:
    case ErrorCode::kInvalidAmount:
    case ErrorCode::kInvalidSigner:
    case ErrorCode::kInvalidSignatureLength:
      return ErrorCategory::kPermit;
    case ErrorCode::kUnknownAccount:
    case ErrorCode::kAccountExists:
      return ErrorCategory::kHost;
  }
  return ErrorCategory::kHost;
}

std::string_view ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kAccess:
      return "access";
    case ErrorCategory::kAccounting:
      return "accounting";
    case ErrorCategory::kState:
      return "state";
    case ErrorCategory::kMigration:
      return "migration";
    case ErrorCategory::kDecoding:
      return "decoding";
    case ErrorCategory::kPermit:
      return "permit";
    case ErrorCategory::kHost:
      return "host";
  }
  return "host";
}

ForwarderError::ForwarderError(ErrorCode code, std::string expected, std::string actual)
    : std::runtime_error(FormatMessage(code, expected, actual)),
      code_(code),
      expected_(std::move(expected)),
      actual_(std::move(actual)) {}

}  // namespace wrapfwd::host
