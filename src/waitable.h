#pragma once

#include <vector>

namespace dsinhibit
{
    class IWaitable
    {
    public:
        virtual ~IWaitable() {}

        virtual int GetFD() { return -1; }

        virtual void OnPollIn() {}
        virtual void OnPollHangUp() {}
        virtual void OnPollError() {}
    };

    // Single-threaded poll() dispatcher. Waitables are not owned.
    class CWaiter
    {
    public:
        bool AddWaitable( IWaitable *pWaitable );
        void RemoveWaitable( IWaitable *pWaitable );

        // Waits up to nTimeoutMs (-1 = forever) and dispatches ready waitables.
        // Returns false on an unrecoverable poll error.
        bool PollEvents( int nTimeoutMs = -1 );

        void Shutdown() { m_bRunning = false; }
        bool IsRunning() const { return m_bRunning; }

        // Polls until Shutdown() is called or polling fails.
        bool Run();

    private:
        std::vector<IWaitable *> m_Waitables;
        bool m_bRunning = true;
    };
}
