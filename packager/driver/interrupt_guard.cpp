#include "interrupt_guard.hpp"

#include <csignal>

namespace linkpack::driver
{
    namespace
    {
        volatile std::sig_atomic_t g_pendingSignal = 0;

        void recordSignal(int signal)
        {
            if (g_pendingSignal == 0)
            {
                g_pendingSignal = signal;
            }
            std::signal(signal, recordSignal);
        }
    } // namespace

    InterruptGuard::InterruptGuard()
    {
        g_pendingSignal = 0;
        m_previousInterrupt = std::signal(SIGINT, recordSignal);
        m_previousTerminate = std::signal(SIGTERM, recordSignal);
#if defined(SIGHUP)
        m_previousHangup = std::signal(SIGHUP, recordSignal);
#endif
    }

    InterruptGuard::~InterruptGuard()
    {
        if (m_previousInterrupt != SIG_ERR)
        {
            std::signal(SIGINT, m_previousInterrupt);
        }
        if (m_previousTerminate != SIG_ERR)
        {
            std::signal(SIGTERM, m_previousTerminate);
        }
#if defined(SIGHUP)
        if (m_previousHangup != SIG_ERR)
        {
            std::signal(SIGHUP, m_previousHangup);
        }
#endif
    }

    int InterruptGuard::pendingSignal() noexcept
    {
        return g_pendingSignal;
    }
} // namespace linkpack::driver
