#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace xg {

  // Calendar date in the xs:date lexical space, without timezone.
  class date {
    int32_t year_ = 1;
    uint8_t month_ = 1;
    uint8_t day_ = 1;

  public:
    date() = default;
    explicit date(std::string_view str);
    date(int32_t year, uint8_t month, uint8_t day);

    std::string
    to_string() const;
    int32_t
    year() const;
    uint8_t
    month() const;
    uint8_t
    day() const;

    bool
    operator==(const date& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const date& d) {
      return os << d.to_string();
    }
  };

} // namespace xg
