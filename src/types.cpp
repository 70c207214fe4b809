// =============================================================================
// types.cpp - Fixed-point helpers, address parsing, error names
// =============================================================================

#include "lend/types.hpp"

#include <algorithm>
#include <cctype>

#include <boost/multiprecision/cpp_int.hpp>

namespace lend {

namespace {

using boost::multiprecision::uint256_t;

const uint256_t U64_MASK = (uint256_t(1) << 64) - 1;

uint256_t to_u256(U128 v) {
    return (uint256_t(static_cast<uint64_t>(v >> 64)) << 64) |
           uint256_t(static_cast<uint64_t>(v));
}

U128 abs_u128(I128 v) {
    return v < 0 ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool is_zero_address(const Address& addr) {
    for (auto b : addr) if (b != 0) return false;
    return true;
}

Address parse_address(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 40) {
        throw std::invalid_argument("invalid address: " + hex);
    }
    if (digits.size() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }

    Address addr = {};
    size_t offset = addr.size() - digits.size() / 2;
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_value(digits[i]);
        int lo = hex_value(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid address: " + hex);
        }
        addr[offset + i / 2] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// =============================================================================
// X18 Arithmetic
// =============================================================================

namespace x18 {

I128 mul_div(I128 a, I128 b, I128 c) {
    if (c == 0) {
        throw MathError("x18::mul_div: division by zero");
    }
    if (a == 0 || b == 0) return 0;

    bool negative = (a < 0) != (b < 0);
    if (c < 0) negative = !negative;

    uint256_t q = to_u256(abs_u128(a)) * to_u256(abs_u128(b)) / to_u256(abs_u128(c));

    // Magnitude must fit in the signed range
    uint256_t limit = to_u256(static_cast<U128>(I128_MAX));
    if (q > limit) {
        throw MathError("x18::mul_div: result overflows 128 bits");
    }

    U128 hi = static_cast<uint64_t>((q >> 64) & U64_MASK);
    U128 lo = static_cast<uint64_t>(q & U64_MASK);
    I128 result = static_cast<I128>((hi << 64) | lo);
    return negative ? -result : result;
}

I128 from_string(const std::string& s) {
    size_t pos = 0;
    bool negative = false;
    if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) {
        negative = s[pos] == '-';
        ++pos;
    }

    I128 int_part = 0;
    I128 frac_part = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool in_fraction = false;

    for (; pos < s.size(); ++pos) {
        char c = s[pos];
        if (c == '.') {
            if (in_fraction) throw std::invalid_argument("invalid decimal: " + s);
            in_fraction = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("invalid decimal: " + s);
        }
        seen_digit = true;
        if (in_fraction) {
            if (frac_digits < 18) {
                frac_part = frac_part * 10 + (c - '0');
                ++frac_digits;
            }
        } else {
            int_part = int_part * 10 + (c - '0');
            if (int_part > I128_MAX / X18_ONE) {
                throw std::invalid_argument("decimal out of range: " + s);
            }
        }
    }
    if (!seen_digit) {
        throw std::invalid_argument("invalid decimal: " + s);
    }

    for (int i = frac_digits; i < 18; ++i) frac_part *= 10;
    I128 value = int_part * X18_ONE + frac_part;
    return negative ? -value : value;
}

std::string raw_to_string(I128 v) {
    if (v == 0) return "0";
    U128 mag = abs_u128(v);
    std::string out;
    while (mag > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (v < 0) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 v) {
    U128 mag = abs_u128(v);
    U128 one = static_cast<U128>(X18_ONE);
    std::string out = raw_to_string(static_cast<I128>(mag / one));

    std::string frac = raw_to_string(static_cast<I128>(mag % one));
    if (frac != "0") {
        frac.insert(frac.begin(), 18 - frac.size(), '0');
        while (!frac.empty() && frac.back() == '0') frac.pop_back();
        out += "." + frac;
    }
    return v < 0 ? "-" + out : out;
}

} // namespace x18

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case ZERO_AMOUNT: return "ZERO_AMOUNT";
        case ASSET_NOT_FOUND: return "ASSET_NOT_FOUND";
        case RESERVE_EXISTS: return "RESERVE_EXISTS";
        case INVALID_CONFIG: return "INVALID_CONFIG";
        case RESERVE_INACTIVE: return "RESERVE_INACTIVE";
        case BORROWING_DISABLED: return "BORROWING_DISABLED";
        case INVALID_ACCOUNT: return "INVALID_ACCOUNT";
        case INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case INSUFFICIENT_COLLATERAL: return "INSUFFICIENT_COLLATERAL";
        case POSITION_NOT_FOUND: return "POSITION_NOT_FOUND";
        case HEALTH_FACTOR_TOO_LOW: return "HEALTH_FACTOR_TOO_LOW";
        case NOT_LIQUIDATABLE: return "NOT_LIQUIDATABLE";
        case ZERO_LIQUIDATION: return "ZERO_LIQUIDATION";
        case PRICE_STALE: return "PRICE_STALE";
        case PRICE_UNAVAILABLE: return "PRICE_UNAVAILABLE";
        case PRICE_DEVIATION_TOO_HIGH: return "PRICE_DEVIATION_TOO_HIGH";
        case INVALID_PRICE: return "INVALID_PRICE";
        case MATH_OVERFLOW: return "MATH_OVERFLOW";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        default: return "UNKNOWN";
    }
}

} // namespace errors

} // namespace lend
