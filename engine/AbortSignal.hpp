#pragma once

#include <atomic>

namespace net_scan::engine
{
    // Raised by the caller to stop a scan from admitting new work. In-flight
    // operations run to completion or to their own timeout.
    class AbortSignal
    {
    public:
        void Raise() { m_raised.store(true); }
        void Reset() { m_raised.store(false); }
        bool IsRaised() const { return m_raised.load(); }

    private:
        std::atomic<bool> m_raised{false};
    };
}
