#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace apparatus::observability {

/*
  Wraps one public operation in a span, the operation counter and the
  latency histogram. Failures are logged and rethrown unchanged; caller
  mistakes (InputError, NotFound) log at warn, everything else at error.
*/
template <typename Fn>
auto ObserveOperation(std::string_view operation, std::string_view subject, Fn&& fn) {
  SpanScope  span(operation, subject);
  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    Metrics::Instance().RecordOperation(operation, success,
                                        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const util::InputError& ex) {
    span.Fail(ex.what());
    APPARATUS_LOG_WARN("operation rejected", {StringField("operation", operation), StringField("subject", subject), StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const util::NotFound& ex) {
    span.Fail(ex.what());
    APPARATUS_LOG_WARN("operation rejected", {StringField("operation", operation), StringField("subject", subject), StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    APPARATUS_LOG_ERROR("operation failed", {StringField("operation", operation), StringField("subject", subject), StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace apparatus::observability
