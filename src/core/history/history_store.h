#pragma once

#include <QHash>
#include <QString>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace vanta {

// Per-action usage counters persisted as {"usage": {exec: count}}.
//
// Writes are debounced: increment() flushes once 20 increments are pending
// or 2 s have passed since the previous flush. flushIfDue() applies the time
// rule from a timer and the destructor flushes anything still pending.
class HistoryStore {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr int kFlushAfterIncrements = 20;
    static constexpr std::chrono::milliseconds kFlushInterval{2000};

    explicit HistoryStore(QString filePath, ClockFn clock = nullptr);
    ~HistoryStore();

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // Missing file = empty history. A malformed file is logged and ignored.
    void load();

    void increment(const QString& target);
    uint32_t usage(const QString& target) const;
    QHash<QString, uint32_t> usageMap() const;

    bool flush();
    bool flushIfDue();

    int pendingIncrements() const;
    int writeCount() const;
    const QString& filePath() const { return m_filePath; }

private:
    bool writeLocked();

    QString m_filePath;
    ClockFn m_clock;

    mutable std::mutex m_mutex;
    QHash<QString, uint32_t> m_usage;
    int m_pending = 0;
    int m_writes = 0;
    Clock::time_point m_lastFlush;
};

} // namespace vanta
