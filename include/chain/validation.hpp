// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace forkscan {

namespace chain {
class CBlock;
} // namespace chain

namespace validation {

/**
 * Validation state - tracks why validation failed
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID // Structurally malformed block
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid())
      return "valid";
    if (debug_message_.empty())
      return reject_reason_;
    return reject_reason_ + " (" + debug_message_ + ")";
  }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Structural well-formedness check run on every decoded block before it is
// admitted to the chain index. Not a consensus check.
//
// Rejects with:
//   "bad-version"         revision/message type not recognized
//   "bad-payload-length"  declared payloadLength != bytes carried
bool CheckBlock(const chain::CBlock &block, ValidationState &state);

} // namespace validation
} // namespace forkscan
