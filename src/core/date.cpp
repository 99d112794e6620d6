#include <ov/core/date.hpp>
#include <ov/core/errors.hpp>

#include <cctype>
#include <cstdio>

namespace ov {
namespace core {

namespace {

// Jours depuis 1970-01-01 (H. Hinnant, "chrono-compatible low-level date algorithms").
long days_from_civil(int y, unsigned m, unsigned d) noexcept {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);             // [0, 399]
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;   // [0, 365]
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;            // [0, 146096]
  return era * 146097 + static_cast<long>(doe) - 719468;
}

void civil_from_days(long z, int& y, unsigned& m, unsigned& d) noexcept {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp  = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int>(yoe) + static_cast<int>(era * 400) + (m <= 2);
}

} // namespace

bool Date::is_leap(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned Date::days_in_month(int year, unsigned month) noexcept {
  static constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap(year)) return 29;
  return kDays[month - 1];
}

Date::Date(int year, unsigned month, unsigned day) : y_(year), m_(month), d_(day) {
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
    throw ConfigError("Date: invalid calendar date " + std::to_string(year) + "-" +
                      std::to_string(month) + "-" + std::to_string(day));
  }
  serial_ = days_from_civil(year, month, day);
}

Date Date::parse(const std::string& iso) {
  // strictement YYYY-MM-DD
  const bool shape = iso.size() == 10 && iso[4] == '-' && iso[7] == '-';
  bool digits = shape;
  for (std::size_t i = 0; digits && i < iso.size(); ++i) {
    if (i == 4 || i == 7) continue;
    digits = std::isdigit(static_cast<unsigned char>(iso[i])) != 0;
  }
  if (!digits) {
    throw ConfigError("Date: expected YYYY-MM-DD, got '" + iso + "'");
  }
  const int y = std::stoi(iso.substr(0, 4));
  const unsigned m = static_cast<unsigned>(std::stoi(iso.substr(5, 2)));
  const unsigned d = static_cast<unsigned>(std::stoi(iso.substr(8, 2)));
  return Date(y, m, d);
}

Date Date::from_serial(long serial) noexcept {
  Date out;
  civil_from_days(serial, out.y_, out.m_, out.d_);
  out.serial_ = serial;
  return out;
}

int Date::weekday() const noexcept {
  // 1970-01-01 était un jeudi (3 avec lundi = 0)
  const long w = (serial_ + 3) % 7;
  return static_cast<int>(w < 0 ? w + 7 : w);
}

Date Date::minus_years(int n) const {
  const int y = y_ - n;
  const unsigned d = (m_ == 2 && d_ == 29 && !is_leap(y)) ? 28u : d_;
  return Date(y, m_, d);
}

std::string Date::to_string() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y_, m_, d_);
  return buf;
}

std::string Date::to_us_string() const {
  return std::to_string(m_) + "/" + std::to_string(d_) + "/" + std::to_string(y_);
}

} // namespace core
} // namespace ov
