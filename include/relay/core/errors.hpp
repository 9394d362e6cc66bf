#pragma once
#include <stdexcept>
#include <string>

namespace relay {

// Base of every error the library raises itself.
// Producer failures are NOT wrapped: they travel verbatim as std::exception_ptr.
class error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The observable completed successfully without a single item.
class no_output_error : public error {
public:
  no_output_error() : error("observable completed without producing any values") {}
};

// The awaiting side (or a task that never started) was cancelled.
class cancelled_error : public error {
public:
  cancelled_error() : error("operation cancelled") {}
  explicit cancelled_error(const std::string& what) : error(what) {}
};

} // namespace relay
