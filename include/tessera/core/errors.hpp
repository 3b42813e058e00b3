#pragma once
#include <stdexcept>

namespace tessera::core {

  // Base of every error raised while encoding, signing or verifying a transaction.
  struct TransactionError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  struct MalformedHexError : TransactionError {
    using TransactionError::TransactionError;
  };

  struct MalformedKeyError : TransactionError {
    using TransactionError::TransactionError;
  };

  // Bad base58 alphabet, bad checksum or wrong decoded length.
  struct InvalidAddressError : TransactionError {
    using TransactionError::TransactionError;
  };

  struct MissingFeeError : TransactionError {
    using TransactionError::TransactionError;
  };

  // Signature bytes were requested in an encoding but the signature is not set.
  struct MissingSignatureError : TransactionError {
    using TransactionError::TransactionError;
  };

  struct VendorFieldTooLongError : TransactionError {
    using TransactionError::TransactionError;
  };

  struct UnrecognizedTypeError : TransactionError {
    using TransactionError::TransactionError;
  };

  // Malformed inputs to verification. A signature that simply does not match
  // is reported as false, never as this error.
  struct VerificationError : TransactionError {
    using TransactionError::TransactionError;
  };

  struct CryptoError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };
}
