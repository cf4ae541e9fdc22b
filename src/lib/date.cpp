#include <xg/date.hpp>

#include <stdexcept>
#include <string>

namespace xg {

  namespace {

    // Proleptic Gregorian; year 0 is 1 BCE.
    bool
    leap(int32_t year) {
      if (year < 0) { year = -(year + 1); }
      return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    uint8_t
    last_day(int32_t year, uint8_t month) {
      static constexpr uint8_t lengths[] = {31, 28, 31, 30, 31, 30,
                                            31, 31, 30, 31, 30, 31};
      return month == 2 && leap(year) ? 29 : lengths[month - 1];
    }

    int64_t
    parse_digits(std::string_view str, std::size_t& pos,
                 std::size_t min_digits, std::size_t max_digits) {
      int64_t value = 0;
      std::size_t start = pos;
      while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9' &&
             pos - start < max_digits) {
        value = value * 10 + (str[pos] - '0');
        ++pos;
      }
      if (pos - start < min_digits) {
        throw std::invalid_argument("date: insufficient digits in '" +
                                    std::string(str) + "'");
      }
      return value;
    }

    void
    expect_dash(std::string_view str, std::size_t& pos, const char* after) {
      if (pos >= str.size() || str[pos] != '-') {
        throw std::invalid_argument(std::string("date: expected '-' after ") +
                                    after + " in '" + std::string(str) + "'");
      }
      ++pos;
    }

  } // namespace

  date::date(std::string_view str) {
    if (str.empty()) { throw std::invalid_argument("date: empty string"); }

    std::size_t pos = 0;
    bool neg_year = false;
    if (str[pos] == '-') {
      neg_year = true;
      ++pos;
    }

    int64_t year = parse_digits(str, pos, 4, 9);
    expect_dash(str, pos, "year");
    int64_t month = parse_digits(str, pos, 2, 2);
    expect_dash(str, pos, "month");
    int64_t day = parse_digits(str, pos, 2, 2);

    if (pos != str.size()) {
      throw std::invalid_argument("date: trailing characters in '" +
                                  std::string(str) + "'");
    }

    *this = date(static_cast<int32_t>(neg_year ? -year : year),
                 static_cast<uint8_t>(month), static_cast<uint8_t>(day));
  }

  date::date(int32_t year, uint8_t month, uint8_t day)
      : year_(year), month_(month), day_(day) {
    if (month < 1 || month > 12) {
      throw std::invalid_argument("date: month out of range");
    }
    if (day < 1 || day > last_day(year, month)) {
      throw std::invalid_argument("date: day out of range");
    }
  }

  std::string
  date::to_string() const {
    std::string result;
    int32_t y = year_;
    if (y < 0) {
      result += '-';
      y = -y;
    }
    std::string year_str = std::to_string(y);
    if (year_str.size() < 4) { year_str.insert(0, 4 - year_str.size(), '0'); }
    result += year_str;
    result += '-';
    result += static_cast<char>('0' + month_ / 10);
    result += static_cast<char>('0' + month_ % 10);
    result += '-';
    result += static_cast<char>('0' + day_ / 10);
    result += static_cast<char>('0' + day_ % 10);
    return result;
  }

  int32_t
  date::year() const {
    return year_;
  }

  uint8_t
  date::month() const {
    return month_;
  }

  uint8_t
  date::day() const {
    return day_;
  }

} // namespace xg
