#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace surge {

// Raised when a producer or consumer breaks the push/cancel protocol:
// double on_subscribe, non-positive request(n), null values or null errors.
class protocol_violation : public std::logic_error {
public:
  explicit protocol_violation(const std::string& what) : std::logic_error(what) {}
};

// Raised by the ERROR backpressure strategy when the bounded queue overflows.
class missing_backpressure : public std::runtime_error {
public:
  explicit missing_backpressure(const std::string& what) : std::runtime_error(what) {}
};

// Extracts a printable message from an exception_ptr (never throws).
inline std::string describe(std::exception_ptr e) noexcept {
  if (!e) return "null exception";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace surge
