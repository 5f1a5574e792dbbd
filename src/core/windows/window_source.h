#pragma once

#include "core/shared/types.h"
#include <QByteArray>
#include <QStringList>
#include <optional>
#include <vector>

namespace vanta {

// One compositor backend able to enumerate open windows.
class WindowSource {
public:
    virtual ~WindowSource() = default;

    virtual QString name() const = 0;

    // nullopt when the backend is not running or its answer is unusable;
    // the snapshot then tries the next source.
    virtual std::optional<std::vector<WindowEntry>> listWindows() = 0;
};

// Source backed by a CLI that prints JSON on stdout.
class CommandWindowSource : public WindowSource {
public:
    CommandWindowSource(QString program, QStringList arguments, int timeoutMs);

    std::optional<std::vector<WindowEntry>> listWindows() override;

protected:
    virtual std::optional<std::vector<WindowEntry>> parse(const QByteArray& output) const = 0;

private:
    QString m_program;
    QStringList m_arguments;
    int m_timeoutMs;
};

// `hyprctl clients -j`
class HyprlandWindowSource : public CommandWindowSource {
public:
    explicit HyprlandWindowSource(int timeoutMs = kDefaultTimeoutMs);

    QString name() const override { return QStringLiteral("hyprland"); }

    static std::optional<std::vector<WindowEntry>> parseClients(const QByteArray& json);

    static constexpr int kDefaultTimeoutMs = 1000;

protected:
    std::optional<std::vector<WindowEntry>> parse(const QByteArray& output) const override;
};

// `swaymsg -t get_tree`. Every node carrying a pid is a window; the
// workspace is the nearest enclosing workspace node ("Unknown" for the
// scratchpad and orphans).
class SwayWindowSource : public CommandWindowSource {
public:
    explicit SwayWindowSource(int timeoutMs = kDefaultTimeoutMs);

    QString name() const override { return QStringLiteral("sway"); }

    static std::optional<std::vector<WindowEntry>> parseTree(const QByteArray& json);

    static constexpr int kDefaultTimeoutMs = 1000;

protected:
    std::optional<std::vector<WindowEntry>> parse(const QByteArray& output) const override;
};

} // namespace vanta
