#include <xg/integer.hpp>

#include <algorithm>
#include <stdexcept>

namespace xg {

  namespace {

    // Multiply magnitude by 10 and add a digit.
    void
    magnitude_mul10_add(std::vector<uint32_t>& mag, uint32_t digit) {
      uint64_t carry = digit;
      for (auto& limb : mag) {
        uint64_t product = static_cast<uint64_t>(limb) * 10 + carry;
        limb = static_cast<uint32_t>(product);
        carry = product >> 32;
      }
      if (carry != 0) { mag.push_back(static_cast<uint32_t>(carry)); }
    }

    // Divide in place by a small divisor, returning the remainder.
    uint32_t
    magnitude_divmod_small(std::vector<uint32_t>& mag, uint32_t divisor) {
      uint64_t rem = 0;
      for (auto i = mag.size(); i-- > 0;) {
        uint64_t cur = (rem << 32) | mag[i];
        mag[i] = static_cast<uint32_t>(cur / divisor);
        rem = cur % divisor;
      }
      while (!mag.empty() && mag.back() == 0) {
        mag.pop_back();
      }
      return static_cast<uint32_t>(rem);
    }

  } // namespace

  integer::integer(int64_t value) {
    uint64_t abs_val;
    if (value < 0) {
      sign_ = sign_type::negative;
      abs_val = static_cast<uint64_t>(-(value + 1)) + 1;
    } else {
      abs_val = static_cast<uint64_t>(value);
    }
    while (abs_val != 0) {
      magnitude_.push_back(static_cast<uint32_t>(abs_val));
      abs_val >>= 32;
    }
  }

  // xs:integer lexical space: an optional sign followed by decimal digits.
  integer::integer(std::string_view str) {
    if (str.empty()) { throw std::invalid_argument("integer: empty string"); }

    std::size_t pos = 0;
    if (str[0] == '+' || str[0] == '-') {
      if (str[0] == '-') { sign_ = sign_type::negative; }
      ++pos;
    }
    if (pos == str.size()) {
      throw std::invalid_argument("integer: no digits in '" + std::string(str) +
                                  "'");
    }

    for (; pos < str.size(); ++pos) {
      char c = str[pos];
      if (c < '0' || c > '9') {
        throw std::invalid_argument("integer: invalid character in '" +
                                    std::string(str) + "'");
      }
      magnitude_mul10_add(magnitude_, static_cast<uint32_t>(c - '0'));
    }

    while (!magnitude_.empty() && magnitude_.back() == 0) {
      magnitude_.pop_back();
    }
    if (magnitude_.empty()) { sign_ = sign_type::positive; }
  }

  std::string
  integer::to_string() const {
    if (is_zero()) { return "0"; }

    std::string digits;
    auto mag = magnitude_;
    while (!mag.empty()) {
      uint32_t chunk = magnitude_divmod_small(mag, 1000000000u);
      for (int i = 0; i < 9; ++i) {
        digits += static_cast<char>('0' + chunk % 10);
        chunk /= 10;
        if (mag.empty() && chunk == 0) { break; }
      }
    }
    while (digits.size() > 1 && digits.back() == '0') {
      digits.pop_back();
    }
    if (sign_ == sign_type::negative) { digits += '-'; }
    std::reverse(digits.begin(), digits.end());
    return digits;
  }

  bool
  integer::is_zero() const {
    return magnitude_.empty();
  }

  integer::sign_type
  integer::sign() const {
    return sign_;
  }

} // namespace xg
