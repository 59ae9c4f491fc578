#include "transfer/transfer_error.h"

namespace splat::transfer {

namespace {

class TransferCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "splat.transfer"; }

  std::string message(int value) const override {
    switch (static_cast<TransferErrc>(value)) {
      case TransferErrc::kSourceUnavailable:
        return "source file unavailable";
      case TransferErrc::kEmpty:
        return "source file is empty";
      case TransferErrc::kDuplicateTransaction:
        return "transaction id already in use";
      case TransferErrc::kNoFreeTransactionId:
        return "no free transaction id";
      case TransferErrc::kNotFound:
        return "transaction not found";
      case TransferErrc::kUnknownFragment:
        return "unknown fragment";
      case TransferErrc::kLengthMismatch:
        return "fragment length mismatch";
      case TransferErrc::kIncomplete:
        return "transfer incomplete";
      case TransferErrc::kIntegrityFailure:
        return "integrity check failed";
      case TransferErrc::kResourceExhausted:
        return "resource exhausted";
      case TransferErrc::kInvalidArgument:
        return "invalid argument";
      case TransferErrc::kTransactionClosed:
        return "transaction closed";
      case TransferErrc::kIoError:
        return "i/o error";
    }
    return "unknown transfer error";
  }
};

}  // namespace

const std::error_category& transfer_category() noexcept {
  static const TransferCategory category;
  return category;
}

std::error_code make_error_code(TransferErrc e) noexcept {
  return {static_cast<int>(e), transfer_category()};
}

ErrorClass classify(std::error_code ec) noexcept {
  if (!ec) {
    return ErrorClass::kNone;
  }
  if (ec.category() != transfer_category()) {
    return ErrorClass::kResourceState;
  }
  switch (static_cast<TransferErrc>(ec.value())) {
    case TransferErrc::kDuplicateTransaction:
    case TransferErrc::kLengthMismatch:
    case TransferErrc::kInvalidArgument:
    case TransferErrc::kTransactionClosed:
    case TransferErrc::kEmpty:
      return ErrorClass::kInputValidation;
    case TransferErrc::kNotFound:
    case TransferErrc::kUnknownFragment:
    case TransferErrc::kSourceUnavailable:
      return ErrorClass::kNotFound;
    case TransferErrc::kIntegrityFailure:
      return ErrorClass::kIntegrityFailure;
    case TransferErrc::kNoFreeTransactionId:
    case TransferErrc::kResourceExhausted:
    case TransferErrc::kIncomplete:
    case TransferErrc::kIoError:
      return ErrorClass::kResourceState;
  }
  return ErrorClass::kResourceState;
}

const char* to_string(ErrorClass cls) noexcept {
  switch (cls) {
    case ErrorClass::kNone:
      return "none";
    case ErrorClass::kInputValidation:
      return "input-validation";
    case ErrorClass::kResourceState:
      return "resource-state";
    case ErrorClass::kIntegrityFailure:
      return "integrity-failure";
    case ErrorClass::kNotFound:
      return "not-found";
  }
  return "unknown";
}

}  // namespace splat::transfer
