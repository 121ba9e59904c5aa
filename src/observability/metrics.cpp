#include "harbor/observability/metrics.h"

#include <atomic>

namespace harbor::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_staged_bytes{0};
std::atomic<std::uint64_t> g_promotions{0};
std::atomic<std::uint64_t> g_sweeps{0};
std::atomic<std::uint64_t> g_expired{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n# TYPE " + name + " counter\n" + name + " " +
           std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordStagedBytes(std::uint64_t bytes) {
    g_staged_bytes.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordPromotion() { g_promotions.fetch_add(1, std::memory_order_relaxed); }

void RecordSweep(std::uint64_t expired) {
    g_sweeps.fetch_add(1, std::memory_order_relaxed);
    g_expired.fetch_add(expired, std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP harbor_up 1 if server is up\n"
           "# TYPE harbor_up gauge\n"
           "harbor_up 1\n" +
           Counter("harbor_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("harbor_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("harbor_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("harbor_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("harbor_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("harbor_staged_bytes_total", "Bytes written into staging objects",
                   g_staged_bytes) +
           Counter("harbor_promotions_total", "Staging uploads promoted to files",
                   g_promotions) +
           Counter("harbor_staging_sweeps_total", "Expiry sweeps run", g_sweeps) +
           Counter("harbor_staging_files_expired_total", "Staging uploads removed by expiry",
                   g_expired);
}

}  // namespace harbor::observability
