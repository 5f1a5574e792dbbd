#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <optional>

namespace vanta {

// Reader for the freedesktop "key file" format shared by .desktop entries
// and icon theme index.theme files.
//
// Lines are trimmed; '#' comments and blank lines are skipped; a key is
// split from its value at the first '='. Localized keys ("Name[de]") are
// kept under their literal name and never shadow the plain key.
class KeyFile {
public:
    static std::optional<KeyFile> load(const QString& filePath);
    static KeyFile parse(const QString& content);

    bool hasGroup(const QString& group) const;
    QStringList groups() const { return m_order; }

    std::optional<QString> value(const QString& group, const QString& key) const;
    QString value(const QString& group, const QString& key, const QString& fallback) const;
    bool boolValue(const QString& group, const QString& key, bool fallback = false) const;
    int intValue(const QString& group, const QString& key, int fallback) const;

    // Splits on `separator`, trimming items and dropping empty ones.
    QStringList listValue(const QString& group, const QString& key, QChar separator) const;

private:
    QHash<QString, QHash<QString, QString>> m_groups;
    QStringList m_order;
};

} // namespace vanta
