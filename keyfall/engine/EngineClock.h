#pragma once

#include <QElapsedTimer>
#include <atomic>

namespace keyfall::engine {

// Monotonic time base shared by the scheduler and the live-input router, so live
// arrival stamps and file event stamps are comparable.
class EngineClock {
public:
    virtual ~EngineClock() = default;
    virtual double nowSeconds() const = 0;
};

// Production clock (QElapsedTimer, monotonic, never paused). nowSeconds() is safe
// from any thread.
class ElapsedEngineClock final : public EngineClock {
public:
    ElapsedEngineClock() { m_timer.start(); }
    double nowSeconds() const override { return double(m_timer.nsecsElapsed()) * 1e-9; }

private:
    QElapsedTimer m_timer;
};

// Driven by hand; used by tests and offline rendering.
class ManualEngineClock final : public EngineClock {
public:
    double nowSeconds() const override { return m_now.load(); }
    void set(double seconds) { m_now.store(seconds); }
    void advance(double seconds) { m_now.store(m_now.load() + seconds); }

private:
    std::atomic<double> m_now{0.0};
};

} // namespace keyfall::engine
