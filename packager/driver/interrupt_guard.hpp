#pragma once

namespace linkpack::driver
{
    // Records SIGINT, SIGTERM and SIGHUP instead of terminating, so the pipeline can restore
    // mutated units before it exits. Previous handlers are reinstated on destruction.
    class InterruptGuard
    {
    public:
        InterruptGuard();
        ~InterruptGuard();

        InterruptGuard(const InterruptGuard&) = delete;
        InterruptGuard& operator=(const InterruptGuard&) = delete;

        // 0 while no signal has arrived, otherwise the first signal received.
        [[nodiscard]] static int pendingSignal() noexcept;

    private:
        using Handler = void (*)(int);

        Handler m_previousInterrupt{nullptr};
        Handler m_previousTerminate{nullptr};
        Handler m_previousHangup{nullptr};
    };
} // namespace linkpack::driver
