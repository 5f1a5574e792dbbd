#include "core/query/latency_metrics.h"
#include "core/shared/logging.h"

namespace vanta {

QJsonObject LatencySnapshot::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("calls")] = static_cast<qint64>(calls);
    json[QStringLiteral("total_ms")] = static_cast<qint64>(totalMs);
    json[QStringLiteral("avg_ms")] = avgMs;
    json[QStringLiteral("max_ms")] = static_cast<qint64>(maxMs);
    return json;
}

LatencyMetric::LatencyMetric(QString label)
    : m_label(std::move(label))
{
}

void LatencyMetric::record(std::chrono::nanoseconds elapsed)
{
    const uint64_t elapsedMs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

    const uint64_t calls = m_calls.fetch_add(1, std::memory_order_relaxed) + 1;
    m_totalMs.fetch_add(elapsedMs, std::memory_order_relaxed);

    uint64_t observed = m_maxMs.load(std::memory_order_relaxed);
    while (elapsedMs > observed
           && !m_maxMs.compare_exchange_weak(observed, elapsedMs, std::memory_order_relaxed)) {
    }

    if (calls % kLogEveryCalls == 0) {
        const LatencySnapshot stats = snapshot();
        LOG_INFO(vQuery, "perf:%s calls=%llu avg_ms=%.2f max_ms=%llu",
                 qUtf8Printable(m_label),
                 static_cast<unsigned long long>(calls),
                 stats.avgMs,
                 static_cast<unsigned long long>(stats.maxMs));
    }
}

LatencySnapshot LatencyMetric::snapshot() const
{
    LatencySnapshot stats;
    stats.calls = m_calls.load(std::memory_order_relaxed);
    stats.totalMs = m_totalMs.load(std::memory_order_relaxed);
    stats.maxMs = m_maxMs.load(std::memory_order_relaxed);
    stats.avgMs = stats.calls > 0
        ? static_cast<double>(stats.totalMs) / static_cast<double>(stats.calls)
        : 0.0;
    return stats;
}

QJsonObject SearchMetrics::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("search")] = search.snapshot().toJson();
    json[QStringLiteral("suggestions")] = suggestions.snapshot().toJson();
    json[QStringLiteral("launch")] = launch.snapshot().toJson();
    return json;
}

} // namespace vanta
