#pragma once

#include "core/windows/window_source.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace vanta {

// Short-lived cache in front of the compositor window sources.
//
// list() returns the cached windows while they are younger than the TTL and
// otherwise refreshes synchronously. Sources are tried in order; the first
// that answers wins. When none answers the list is empty.
class WindowSnapshot {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultTtl{400};

    explicit WindowSnapshot(std::vector<std::unique_ptr<WindowSource>> sources,
                            std::chrono::milliseconds ttl = kDefaultTtl,
                            ClockFn clock = nullptr);

    // Hyprland first, then Sway.
    static std::vector<std::unique_ptr<WindowSource>> defaultSources();

    std::vector<WindowEntry> list();

    void invalidate();

private:
    std::vector<WindowEntry> query();

    std::vector<std::unique_ptr<WindowSource>> m_sources;
    std::chrono::milliseconds m_ttl;
    ClockFn m_clock;

    std::mutex m_mutex;
    std::vector<WindowEntry> m_cached;
    Clock::time_point m_updatedAt;
    bool m_valid = false;
};

} // namespace vanta
