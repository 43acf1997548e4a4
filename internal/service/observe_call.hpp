#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace healthstore::service {

// Runs fn, logging its latency, and the error with the route when it throws.
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      HEALTHSTORE_LOG_DEBUG("Call finished", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      HEALTHSTORE_LOG_DEBUG("Call finished", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    HEALTHSTORE_LOG_ERROR("Call failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                          observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace healthstore::service
