#include "core/history/history_store.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace vanta {

HistoryStore::HistoryStore(QString filePath, ClockFn clock)
    : m_filePath(std::move(filePath))
    , m_clock(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
    , m_lastFlush(m_clock())
{
}

HistoryStore::~HistoryStore()
{
    flush();
}

void HistoryStore::load()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_usage.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vCore, "Failed to open history file: %s", qUtf8Printable(m_filePath));
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vCore, "Ignoring malformed history file %s: %s",
                 qUtf8Printable(m_filePath), qUtf8Printable(parseError.errorString()));
        return;
    }

    const QJsonObject usage = doc.object().value(QStringLiteral("usage")).toObject();
    for (auto it = usage.constBegin(); it != usage.constEnd(); ++it) {
        const qint64 count = it.value().toInteger(-1);
        if (count >= 0) {
            m_usage.insert(it.key(), static_cast<uint32_t>(qMin<qint64>(count, UINT32_MAX)));
        }
    }
    LOG_INFO(vCore, "Loaded usage history: %d targets", static_cast<int>(m_usage.size()));
}

void HistoryStore::increment(const QString& target)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    uint32_t& count = m_usage[target];
    if (count < UINT32_MAX) {
        ++count;
    }
    ++m_pending;

    if (m_pending >= kFlushAfterIncrements || m_clock() - m_lastFlush >= kFlushInterval) {
        writeLocked();
    }
}

uint32_t HistoryStore::usage(const QString& target) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_usage.value(target, 0);
}

QHash<QString, uint32_t> HistoryStore::usageMap() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_usage;
}

bool HistoryStore::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending == 0) {
        return true;
    }
    return writeLocked();
}

bool HistoryStore::flushIfDue()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending == 0 || m_clock() - m_lastFlush < kFlushInterval) {
        return true;
    }
    return writeLocked();
}

int HistoryStore::pendingIncrements() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending;
}

int HistoryStore::writeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writes;
}

bool HistoryStore::writeLocked()
{
    QJsonObject usage;
    for (auto it = m_usage.constBegin(); it != m_usage.constEnd(); ++it) {
        usage.insert(it.key(), static_cast<qint64>(it.value()));
    }
    QJsonObject root;
    root.insert(QStringLiteral("usage"), usage);

    // Failed writes also restart the flush window.
    m_lastFlush = m_clock();

    const QString parentDir = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_WARN(vCore, "Failed to create history directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)
        || file.write(QJsonDocument(root).toJson(QJsonDocument::Indented)) < 0
        || !file.commit()) {
        LOG_WARN(vCore, "Failed to write history file: %s", qUtf8Printable(m_filePath));
        return false;
    }

    m_pending = 0;
    ++m_writes;
    LOG_DEBUG(vCore, "History flushed (%d targets)", static_cast<int>(m_usage.size()));
    return true;
}

} // namespace vanta
