#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>

#include "sea/Json.hpp"

namespace sea {

// Telemetry for one action invocation; lives only for the dispatch.
struct ActionEvent {
  using Clock = std::chrono::steady_clock;

  std::string storeId;
  std::string name;
  Value args = json::array();

  std::optional<Value> result;      // set on success only
  std::exception_ptr error;         // set on failure only
  std::string errorMessage;

  bool async     = false;
  bool cancelled = false;           // completion dropped before settling

  Clock::time_point startTime{};
  Clock::time_point endTime{};
  Clock::duration   duration{};

  bool failed() const noexcept { return error != nullptr; }
  double durationMs() const {
    return std::chrono::duration<double, std::milli>(duration).count();
  }
};

// what() of the stored exception, or a placeholder for non-std exceptions.
std::string describeError(const std::exception_ptr& error);

} // namespace sea
