#include <ov/core/errors.hpp>

#include <utility>

namespace ov {

namespace {
std::string not_found_message(int requested, const std::vector<std::string>& available) {
  std::string msg = "Maturity " + std::to_string(requested) +
                    "-year not found in the interpolated curve. Available maturities: [";
  for (std::size_t i = 0; i < available.size(); ++i) {
    if (i) msg += ", ";
    msg += available[i];
  }
  msg += "]";
  return msg;
}
} // namespace

MaturityNotFoundError::MaturityNotFoundError(int requested, std::vector<std::string> available)
    : Error(not_found_message(requested, available)),
      requested_(requested),
      available_(std::move(available)) {}

} // namespace ov
