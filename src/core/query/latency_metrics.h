#pragma once

#include <QJsonObject>
#include <QString>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace vanta {

struct LatencySnapshot {
    uint64_t calls = 0;
    uint64_t totalMs = 0;
    double avgMs = 0.0;
    uint64_t maxMs = 0;

    QJsonObject toJson() const;
};

// Lock-free call counter with total and maximum latency. Every 50th call
// logs a summary line.
class LatencyMetric {
public:
    static constexpr uint64_t kLogEveryCalls = 50;

    explicit LatencyMetric(QString label);

    void record(std::chrono::nanoseconds elapsed);
    LatencySnapshot snapshot() const;

    const QString& label() const { return m_label; }

private:
    QString m_label;
    std::atomic<uint64_t> m_calls{0};
    std::atomic<uint64_t> m_totalMs{0};
    std::atomic<uint64_t> m_maxMs{0};
};

// The three instrumented entry points. Owned by the service and shared with
// the query engine.
struct SearchMetrics {
    LatencyMetric search{QStringLiteral("search")};
    LatencyMetric suggestions{QStringLiteral("suggestions")};
    LatencyMetric launch{QStringLiteral("launch")};

    QJsonObject toJson() const;
};

// Records the lifetime of the guard into `metric`.
class ScopedLatency {
public:
    explicit ScopedLatency(LatencyMetric* metric)
        : m_metric(metric)
        , m_start(std::chrono::steady_clock::now())
    {
    }
    ~ScopedLatency()
    {
        if (m_metric) {
            m_metric->record(std::chrono::steady_clock::now() - m_start);
        }
    }

    ScopedLatency(const ScopedLatency&) = delete;
    ScopedLatency& operator=(const ScopedLatency&) = delete;

private:
    LatencyMetric* m_metric;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace vanta
