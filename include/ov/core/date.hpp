#pragma once
/**
 * @file date.hpp
 * @brief Date calendaire (grégorien proleptique), sans fuseau ni heure.
 *
 * Représentation interne : nombre de jours depuis 1970-01-01 (serial).
 * Conversions civil <-> serial selon l’algorithme "days from civil"
 * (H. Hinnant), exact sur toute la plage utile.
 *
 * # Conventions
 * - Format texte ISO `YYYY-MM-DD` (parse/to_string).
 * - weekday() : 0 = lundi ... 6 = dimanche.
 * - Différence de dates en jours entiers (b - a).
 */

#include <string>

namespace ov {
namespace core {

class Date {
public:
  /// 1970-01-01
  Date() = default;

  /// @brief Construit une date valide.
  /// @throws ov::ConfigError si (y, m, d) n’est pas une date calendaire.
  Date(int year, unsigned month, unsigned day);

  /// @brief Parse `YYYY-MM-DD`.
  /// @throws ov::ConfigError si le texte n’est pas une date ISO valide.
  static Date parse(const std::string& iso);

  /// @brief Date depuis un serial (jours depuis 1970-01-01).
  static Date from_serial(long serial) noexcept;

  int year() const noexcept { return y_; }
  unsigned month() const noexcept { return m_; }
  unsigned day() const noexcept { return d_; }

  long serial() const noexcept { return serial_; }

  /// 0 = lundi ... 6 = dimanche.
  int weekday() const noexcept;

  Date add_days(long n) const noexcept { return from_serial(serial_ + n); }

  /// @brief Recule de n années ; un 29/02 devient 28/02 si l’année cible n’est pas bissextile.
  Date minus_years(int n) const;

  std::string to_string() const;         ///< `YYYY-MM-DD`
  std::string to_us_string() const;      ///< `M/D/YYYY` (rapport)

  static bool is_leap(int year) noexcept;
  static unsigned days_in_month(int year, unsigned month) noexcept;

  friend long operator-(const Date& a, const Date& b) noexcept { return a.serial_ - b.serial_; }
  friend bool operator==(const Date& a, const Date& b) noexcept { return a.serial_ == b.serial_; }
  friend bool operator!=(const Date& a, const Date& b) noexcept { return a.serial_ != b.serial_; }
  friend bool operator<(const Date& a, const Date& b) noexcept { return a.serial_ < b.serial_; }
  friend bool operator<=(const Date& a, const Date& b) noexcept { return a.serial_ <= b.serial_; }
  friend bool operator>(const Date& a, const Date& b) noexcept { return a.serial_ > b.serial_; }
  friend bool operator>=(const Date& a, const Date& b) noexcept { return a.serial_ >= b.serial_; }

private:
  int      y_{1970};
  unsigned m_{1};
  unsigned d_{1};
  long     serial_{0};
};

} // namespace core
} // namespace ov
