#include "core/windows/window_snapshot.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace vanta {

WindowSnapshot::WindowSnapshot(std::vector<std::unique_ptr<WindowSource>> sources,
                               std::chrono::milliseconds ttl,
                               ClockFn clock)
    : m_sources(std::move(sources))
    , m_ttl(ttl)
    , m_clock(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
{
}

std::vector<std::unique_ptr<WindowSource>> WindowSnapshot::defaultSources()
{
    std::vector<std::unique_ptr<WindowSource>> sources;
    sources.push_back(std::make_unique<HyprlandWindowSource>());
    sources.push_back(std::make_unique<SwayWindowSource>());
    return sources;
}

std::vector<WindowEntry> WindowSnapshot::list()
{
    // Held across the refresh so concurrent callers share one process spawn.
    std::lock_guard<std::mutex> lock(m_mutex);

    const Clock::time_point now = m_clock();
    if (m_valid && now - m_updatedAt < m_ttl) {
        return m_cached;
    }

    m_cached = query();
    m_updatedAt = m_clock();
    m_valid = true;
    return m_cached;
}

void WindowSnapshot::invalidate()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_valid = false;
}

std::vector<WindowEntry> WindowSnapshot::query()
{
    for (const auto& source : m_sources) {
        std::optional<std::vector<WindowEntry>> windows = source->listWindows();
        if (!windows) {
            continue;
        }
        windows->erase(std::remove_if(windows->begin(), windows->end(),
                                      [](const WindowEntry& w) { return w.title.isEmpty(); }),
                       windows->end());
        LOG_DEBUG(vWindows, "%s reported %d window(s)",
                  qUtf8Printable(source->name()), static_cast<int>(windows->size()));
        return std::move(*windows);
    }
    return {};
}

} // namespace vanta
