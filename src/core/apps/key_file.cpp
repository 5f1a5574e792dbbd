#include "core/apps/key_file.h"

#include <QFile>

namespace vanta {

std::optional<KeyFile> KeyFile::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }
    return parse(QString::fromUtf8(file.readAll()));
}

KeyFile KeyFile::parse(const QString& content)
{
    KeyFile keyFile;
    QString currentGroup;
    bool inGroup = false;

    const QStringList lines = content.split(QLatin1Char('\n'));
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        if (line.startsWith(QLatin1Char('[')) && line.endsWith(QLatin1Char(']'))) {
            currentGroup = line.mid(1, line.size() - 2);
            // A repeated group header is ignored along with its keys.
            inGroup = !keyFile.m_groups.contains(currentGroup);
            if (inGroup) {
                keyFile.m_groups.insert(currentGroup, {});
                keyFile.m_order.append(currentGroup);
            }
            continue;
        }

        if (!inGroup) {
            continue;
        }

        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            continue;
        }
        const QString key = line.left(eq).trimmed();
        const QString value = line.mid(eq + 1).trimmed();
        QHash<QString, QString>& entries = keyFile.m_groups[currentGroup];
        entries.insert(key, value);
    }

    return keyFile;
}

bool KeyFile::hasGroup(const QString& group) const
{
    return m_groups.contains(group);
}

std::optional<QString> KeyFile::value(const QString& group, const QString& key) const
{
    const auto groupIt = m_groups.constFind(group);
    if (groupIt == m_groups.constEnd()) {
        return std::nullopt;
    }
    const auto it = groupIt->constFind(key);
    if (it == groupIt->constEnd()) {
        return std::nullopt;
    }
    return *it;
}

QString KeyFile::value(const QString& group, const QString& key, const QString& fallback) const
{
    return value(group, key).value_or(fallback);
}

bool KeyFile::boolValue(const QString& group, const QString& key, bool fallback) const
{
    const std::optional<QString> raw = value(group, key);
    if (!raw) {
        return fallback;
    }
    return raw->compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

int KeyFile::intValue(const QString& group, const QString& key, int fallback) const
{
    const std::optional<QString> raw = value(group, key);
    if (!raw) {
        return fallback;
    }
    bool ok = false;
    const int parsed = raw->toInt(&ok);
    return ok ? parsed : fallback;
}

QStringList KeyFile::listValue(const QString& group, const QString& key, QChar separator) const
{
    QStringList items;
    const std::optional<QString> raw = value(group, key);
    if (!raw) {
        return items;
    }
    const QStringList parts = raw->split(separator);
    for (const QString& part : parts) {
        const QString item = part.trimmed();
        if (!item.isEmpty()) {
            items.append(item);
        }
    }
    return items;
}

} // namespace vanta
