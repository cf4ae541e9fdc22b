#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xg {

  // Arbitrary-precision integer for xs:integer and its derived literals.
  class integer {
  public:
    enum class sign_type : uint8_t { positive, negative };

  private:
    sign_type sign_ = sign_type::positive;
    // Little-endian base-2^32 limbs; empty means zero.
    std::vector<uint32_t> magnitude_;

  public:
    integer() = default;
    explicit integer(int64_t value);
    explicit integer(std::string_view str);

    std::string
    to_string() const;
    bool
    is_zero() const;
    sign_type
    sign() const;

    bool
    operator==(const integer& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const integer& i) {
      return os << i.to_string();
    }
  };

} // namespace xg
