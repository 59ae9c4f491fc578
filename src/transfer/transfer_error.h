#pragma once

#include <string>
#include <system_error>

namespace splat::transfer {

// Error kinds reported by the transfer core.
enum class TransferErrc {
  kSourceUnavailable = 1,  // source file missing or unreadable
  kEmpty,                  // zero-length source
  kDuplicateTransaction,   // tid already active in the namespace
  kNoFreeTransactionId,    // all TX tids in use
  kNotFound,               // no transaction under (direction, tid)
  kUnknownFragment,        // fragment index out of range or not missing
  kLengthMismatch,         // payload length disagrees with the fragment slot
  kIncomplete,             // finalize requested while fragments are missing
  kIntegrityFailure,       // assembled digest does not match
  kResourceExhausted,      // configured memory or size bound reached
  kInvalidArgument,        // malformed offset, size or index list
  kTransactionClosed,      // operation on an aborted transaction
  kIoError,                // read or write failed mid-transfer
};

// Coarse grouping of TransferErrc used by callers deciding how to react.
enum class ErrorClass {
  kNone,
  kInputValidation,
  kResourceState,
  kIntegrityFailure,
  kNotFound,
};

const std::error_category& transfer_category() noexcept;

std::error_code make_error_code(TransferErrc e) noexcept;

// Maps an error onto its class. Codes from other categories are reported as
// kResourceState (I/O and system failures).
ErrorClass classify(std::error_code ec) noexcept;

const char* to_string(ErrorClass cls) noexcept;

}  // namespace splat::transfer

namespace std {
template <>
struct is_error_code_enum<splat::transfer::TransferErrc> : true_type {};
}  // namespace std
