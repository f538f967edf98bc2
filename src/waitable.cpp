#include "waitable.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>

#include "log.hpp"

namespace dsinhibit
{
    static LogScope log_waiter( "Waiter" );

    bool CWaiter::AddWaitable( IWaitable *pWaitable )
    {
        if ( !pWaitable || pWaitable->GetFD() < 0 )
        {
            log_waiter.errorf( "Refusing to add waitable without a file descriptor" );
            return false;
        }

        if ( std::find( m_Waitables.begin(), m_Waitables.end(), pWaitable ) == m_Waitables.end() )
            m_Waitables.push_back( pWaitable );
        return true;
    }

    void CWaiter::RemoveWaitable( IWaitable *pWaitable )
    {
        m_Waitables.erase( std::remove( m_Waitables.begin(), m_Waitables.end(), pWaitable ), m_Waitables.end() );
    }

    bool CWaiter::PollEvents( int nTimeoutMs )
    {
        // Copy so callbacks may add or remove waitables.
        std::vector<IWaitable *> waitables = m_Waitables;

        std::vector<pollfd> pollFds;
        pollFds.reserve( waitables.size() );
        for ( IWaitable *pWaitable : waitables )
            pollFds.push_back( pollfd{ .fd = pWaitable->GetFD(), .events = POLLIN, .revents = 0 } );

        int nRet = poll( pollFds.data(), pollFds.size(), nTimeoutMs );
        if ( nRet < 0 )
        {
            if ( errno == EINTR || errno == EAGAIN )
                return true;

            log_waiter.errorf( "poll failed: %s", strerror( errno ) );
            return false;
        }

        for ( size_t i = 0; i < pollFds.size() && nRet > 0; i++ )
        {
            short nEvents = pollFds[i].revents;
            if ( !nEvents )
                continue;
            nRet--;

            IWaitable *pWaitable = waitables[i];
            if ( std::find( m_Waitables.begin(), m_Waitables.end(), pWaitable ) == m_Waitables.end() )
                continue;

            if ( nEvents & POLLIN )
                pWaitable->OnPollIn();
            else if ( nEvents & POLLHUP )
                pWaitable->OnPollHangUp();
            else if ( nEvents & ( POLLERR | POLLNVAL ) )
                pWaitable->OnPollError();
        }

        return true;
    }

    bool CWaiter::Run()
    {
        while ( m_bRunning )
        {
            if ( !PollEvents() )
                return false;
        }
        return true;
    }
}
