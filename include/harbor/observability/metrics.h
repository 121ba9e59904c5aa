#pragma once

#include <cstdint>
#include <string>

namespace harbor::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
/// @brief Record bytes accepted into staging objects by chunk writes.
void RecordStagedBytes(std::uint64_t bytes);
void RecordPromotion();
/// @brief Record one expiry sweep and how many staging rows it removed.
void RecordSweep(std::uint64_t expired);

}  // namespace harbor::observability
