#pragma once

#include <functional>
#include <initializer_list>
#include <signal.h>

#include "waitable.h"

namespace dsinhibit
{
    // Blocks the given signals and delivers them through a signalfd.
    // The previous signal mask is restored on destruction.
    class CSignalHandler final : public IWaitable
    {
    public:
        using SignalCallback = std::function<void( int nSignal )>;

        CSignalHandler();
        ~CSignalHandler();

        CSignalHandler( const CSignalHandler & ) = delete;
        CSignalHandler &operator=( const CSignalHandler & ) = delete;

        bool Init( std::initializer_list<int> signals, SignalCallback fnCallback );

        int GetFD() override { return m_nSignalFD; }
        void OnPollIn() override;

    private:
        int m_nSignalFD = -1;
        bool m_bMaskChanged = false;
        sigset_t m_OldMask;
        SignalCallback m_fnCallback;
    };
}
