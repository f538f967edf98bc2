#include "SignalHandler.h"

#include <cerrno>
#include <cstring>
#include <sys/signalfd.h>
#include <unistd.h>

#include "log.hpp"

namespace dsinhibit
{
    static LogScope log_signal( "Signal" );

    CSignalHandler::CSignalHandler()
    {
        sigemptyset( &m_OldMask );
    }

    CSignalHandler::~CSignalHandler()
    {
        if ( m_nSignalFD >= 0 )
        {
            close( m_nSignalFD );
            m_nSignalFD = -1;
        }

        if ( m_bMaskChanged )
            sigprocmask( SIG_SETMASK, &m_OldMask, nullptr );
    }

    bool CSignalHandler::Init( std::initializer_list<int> signals, SignalCallback fnCallback )
    {
        m_fnCallback = std::move( fnCallback );

        sigset_t mask;
        sigemptyset( &mask );
        for ( int nSignal : signals )
            sigaddset( &mask, nSignal );

        if ( sigprocmask( SIG_BLOCK, &mask, &m_OldMask ) < 0 )
        {
            log_signal.errorf( "Failed to block signals: %s", strerror( errno ) );
            return false;
        }
        m_bMaskChanged = true;

        m_nSignalFD = signalfd( -1, &mask, SFD_NONBLOCK | SFD_CLOEXEC );
        if ( m_nSignalFD < 0 )
        {
            log_signal.errorf( "Failed to create signalfd: %s", strerror( errno ) );
            return false;
        }

        return true;
    }

    void CSignalHandler::OnPollIn()
    {
        signalfd_siginfo info;

        for ( ;; )
        {
            ssize_t nLength = read( m_nSignalFD, &info, sizeof( info ) );
            if ( nLength < 0 )
            {
                if ( errno == EINTR )
                    continue;
                if ( errno != EAGAIN )
                    log_signal.errorf( "Failed to read signalfd: %s", strerror( errno ) );
                return;
            }

            if ( nLength != sizeof( info ) )
                return;

            log_signal.debugf( "Received %s", strsignal( (int)info.ssi_signo ) );

            if ( m_fnCallback )
                m_fnCallback( (int)info.ssi_signo );
        }
    }
}
