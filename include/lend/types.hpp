#ifndef LEND_TYPES_HPP
#define LEND_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <stdexcept>

namespace lend {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// Build an address whose trailing 8 bytes hold `id` (big-endian)
constexpr Address address_from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

bool is_zero_address(const Address& addr);

// Parse "0x..." (or bare) hex, at most 40 digits, left-padded with zeros
Address parse_address(const std::string& hex);
std::string to_hex(const Address& addr);

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;  // 0.5e18
constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);

constexpr uint64_t SECONDS_PER_YEAR = 31536000;  // 365 days

// Raised by the fixed-point helpers on overflow or division by zero
class MathError : public std::runtime_error {
public:
    explicit MathError(const std::string& msg) : std::runtime_error(msg) {}
};

namespace x18 {

// a * b / c with a 256-bit intermediate, truncated toward zero.
// Throws MathError when c == 0 or the quotient does not fit in 128 bits.
I128 mul_div(I128 a, I128 b, I128 c);

inline I128 mul(I128 a, I128 b) {
    return mul_div(a, b, X18_ONE);
}

inline I128 div(I128 a, I128 b) {
    return mul_div(a, X18_ONE, b);
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

// Exact decimal parse: "12", "0.04", "-1.5". Digits past the 18th are truncated.
// Throws std::invalid_argument on malformed input.
I128 from_string(const std::string& s);

// Decimal rendering with the trailing zeros of the fraction stripped
std::string to_string(I128 v);

// Integer rendering of a raw 128-bit value
std::string raw_to_string(I128 v);

} // namespace x18

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t ZERO_AMOUNT = -1;
constexpr int32_t ASSET_NOT_FOUND = -2;
constexpr int32_t RESERVE_EXISTS = -3;
constexpr int32_t INVALID_CONFIG = -4;
constexpr int32_t RESERVE_INACTIVE = -5;
constexpr int32_t BORROWING_DISABLED = -6;
constexpr int32_t INVALID_ACCOUNT = -7;

// State
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -11;
constexpr int32_t INSUFFICIENT_COLLATERAL = -12;
constexpr int32_t POSITION_NOT_FOUND = -13;

// Safety
constexpr int32_t HEALTH_FACTOR_TOO_LOW = -20;
constexpr int32_t NOT_LIQUIDATABLE = -21;
constexpr int32_t ZERO_LIQUIDATION = -22;
constexpr int32_t PRICE_STALE = -23;
constexpr int32_t PRICE_UNAVAILABLE = -24;
constexpr int32_t PRICE_DEVIATION_TOO_HIGH = -25;
constexpr int32_t INVALID_PRICE = -26;
constexpr int32_t MATH_OVERFLOW = -27;

// Authorization
constexpr int32_t UNAUTHORIZED = -40;

const char* to_string(int32_t code);
}

} // namespace lend

#endif // LEND_TYPES_HPP
