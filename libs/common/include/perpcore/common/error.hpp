#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace perpcore {
namespace common {

enum class ErrorCode : std::uint16_t {
  // authorization
  kUnauthorized = 1001,
  kNotPositionOwner = 1002,

  // lifecycle state
  kMarketNotFound = 2001,
  kMarketInactive = 2002,
  kSymbolNotFound = 2003,
  kSymbolAlreadyExists = 2004,
  kSymbolInactive = 2005,
  kOrderNotFound = 2006,
  kPositionNotFound = 2007,
  kPositionHealthy = 2008,
  kPoolInactive = 2009,
  kTokenNotSupported = 2010,
  kTokenAlreadyExists = 2011,
  kEscrowNotFound = 2012,
  kReceiptNotExpired = 2013,
  kReceiptAlreadyExercised = 2014,
  kVaultNotFound = 2015,

  // sizing
  kZeroSize = 3001,
  kBelowMinSize = 3002,
  kNotLotAligned = 3003,
  kOpenInterestExceeded = 3004,
  kReduceOnlyExceedsPosition = 3005,

  // solvency
  kInsufficientCollateral = 4001,
  kLeverageExceeded = 4002,
  kInsufficientPoolReserve = 4003,
  kInsufficientLiquidity = 4004,
  kPositionLiquidatable = 4005,
  kInsufficientBalance = 4006,

  // oracle
  kOracleMismatch = 5001,
  kOracleStale = 5002,
  kInvalidPrice = 5003,

  // domain mismatch
  kCollateralTokenMismatch = 6001,
  kBidTokenMismatch = 6002,
  kCollateralModeMismatch = 6003,
  kInvalidLinkedPosition = 6004,

  // arithmetic / configuration
  kArithmeticOverflow = 7001,
  kInvalidConfig = 7002,
};

enum class ErrorCategory : std::uint8_t {
  kAuthorization,
  kLifecycle,
  kSizing,
  kSolvency,
  kOracle,
  kDomainMismatch,
  kArithmetic,
};

inline constexpr ErrorCategory category_of(ErrorCode code) noexcept {
  switch (static_cast<std::uint16_t>(code) / 1000) {
    case 1:
      return ErrorCategory::kAuthorization;
    case 2:
      return ErrorCategory::kLifecycle;
    case 3:
      return ErrorCategory::kSizing;
    case 4:
      return ErrorCategory::kSolvency;
    case 5:
      return ErrorCategory::kOracle;
    case 6:
      return ErrorCategory::kDomainMismatch;
    default:
      return ErrorCategory::kArithmetic;
  }
}

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kUnauthorized: return "unauthorized";
    case ErrorCode::kNotPositionOwner: return "not position owner";
    case ErrorCode::kMarketNotFound: return "market not found";
    case ErrorCode::kMarketInactive: return "market inactive";
    case ErrorCode::kSymbolNotFound: return "symbol not found";
    case ErrorCode::kSymbolAlreadyExists: return "symbol already exists";
    case ErrorCode::kSymbolInactive: return "symbol inactive";
    case ErrorCode::kOrderNotFound: return "order not found";
    case ErrorCode::kPositionNotFound: return "position not found";
    case ErrorCode::kPositionHealthy: return "position not liquidatable";
    case ErrorCode::kPoolInactive: return "pool inactive";
    case ErrorCode::kTokenNotSupported: return "token not supported";
    case ErrorCode::kTokenAlreadyExists: return "token already exists";
    case ErrorCode::kEscrowNotFound: return "escrow not found";
    case ErrorCode::kReceiptNotExpired: return "receipt not expired";
    case ErrorCode::kReceiptAlreadyExercised: return "receipt already exercised";
    case ErrorCode::kVaultNotFound: return "vault not found";
    case ErrorCode::kZeroSize: return "zero size";
    case ErrorCode::kBelowMinSize: return "below min size";
    case ErrorCode::kNotLotAligned: return "size not lot aligned";
    case ErrorCode::kOpenInterestExceeded: return "open interest exceeded";
    case ErrorCode::kReduceOnlyExceedsPosition: return "reduce-only size exceeds position";
    case ErrorCode::kInsufficientCollateral: return "insufficient collateral";
    case ErrorCode::kLeverageExceeded: return "leverage exceeded";
    case ErrorCode::kInsufficientPoolReserve: return "insufficient pool reserve";
    case ErrorCode::kInsufficientLiquidity: return "insufficient pool liquidity";
    case ErrorCode::kPositionLiquidatable: return "position would be liquidatable";
    case ErrorCode::kInsufficientBalance: return "insufficient balance";
    case ErrorCode::kOracleMismatch: return "oracle mismatch";
    case ErrorCode::kOracleStale: return "oracle price stale";
    case ErrorCode::kInvalidPrice: return "invalid price";
    case ErrorCode::kCollateralTokenMismatch: return "collateral token mismatch";
    case ErrorCode::kBidTokenMismatch: return "bid token mismatch";
    case ErrorCode::kCollateralModeMismatch: return "collateral mode mismatch";
    case ErrorCode::kInvalidLinkedPosition: return "invalid linked position";
    case ErrorCode::kArithmeticOverflow: return "arithmetic overflow";
    case ErrorCode::kInvalidConfig: return "invalid config";
  }
  return "unknown error";
}

class EngineError : public std::runtime_error {
 public:
  explicit EngineError(ErrorCode code)
      : std::runtime_error(to_string(code)), code_(code) {}
  EngineError(ErrorCode code, const std::string& detail)
      : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] ErrorCategory category() const noexcept { return category_of(code_); }

 private:
  ErrorCode code_;
};

// Aborts the current operation when `condition` does not hold.
inline void ensure(bool condition, ErrorCode code) {
  if (!condition) {
    throw EngineError(code);
  }
}

}  // namespace common
}  // namespace perpcore
