#include "InotifyWatcher.h"

#include <cerrno>
#include <cstring>
#include <sys/inotify.h>
#include <unistd.h>

#include "log.hpp"

namespace dsinhibit
{
    static LogScope log_inotify( "Inotify" );

    CInotifyWatcher::CInotifyWatcher()
    {
    }

    CInotifyWatcher::~CInotifyWatcher()
    {
        if ( m_nInotifyFD >= 0 )
        {
            close( m_nInotifyFD );
            m_nInotifyFD = -1;
        }
    }

    bool CInotifyWatcher::Init()
    {
        if ( m_nInotifyFD >= 0 )
            return true;

        m_nInotifyFD = inotify_init1( IN_NONBLOCK | IN_CLOEXEC );
        if ( m_nInotifyFD < 0 )
        {
            log_inotify.errorf( "Failed to create inotify instance: %s", strerror( errno ) );
            return false;
        }

        return true;
    }

    int CInotifyWatcher::AddWatch( const std::string &sPath, uint32_t uMask, InotifyCallback fnCallback )
    {
        if ( m_nInotifyFD < 0 )
        {
            log_inotify.errorf( "Cannot watch %s before Init()", sPath.c_str() );
            return -1;
        }

        int nWatch = inotify_add_watch( m_nInotifyFD, sPath.c_str(), uMask );
        if ( nWatch < 0 )
        {
            log_inotify.errorf( "Failed to watch %s: %s", sPath.c_str(), strerror( errno ) );
            return -1;
        }

        m_Watches[nWatch] = Watch{ sPath, std::move( fnCallback ) };
        return nWatch;
    }

    void CInotifyWatcher::RemoveWatch( int nWatch )
    {
        if ( !m_Watches.erase( nWatch ) )
            return;

        // EINVAL means the kernel already dropped it (IN_DELETE_SELF / IN_IGNORED).
        if ( inotify_rm_watch( m_nInotifyFD, nWatch ) < 0 && errno != EINVAL )
            log_inotify.warnf( "Failed to remove watch %d: %s", nWatch, strerror( errno ) );
    }

    int CInotifyWatcher::FindWatch( const std::string &sPath ) const
    {
        for ( const auto &[ nWatch, watch ] : m_Watches )
        {
            if ( watch.sPath == sPath )
                return nWatch;
        }
        return -1;
    }

    void CInotifyWatcher::OnPollIn()
    {
        alignas( struct inotify_event ) char buffer[4096];

        for ( ;; )
        {
            ssize_t nLength = read( m_nInotifyFD, buffer, sizeof( buffer ) );
            if ( nLength < 0 )
            {
                if ( errno == EINTR )
                    continue;
                if ( errno != EAGAIN )
                    log_inotify.errorf( "Failed to read inotify events: %s", strerror( errno ) );
                return;
            }

            if ( nLength == 0 )
                return;

            for ( char *pCursor = buffer; pCursor < buffer + nLength; )
            {
                const struct inotify_event *pRawEvent = reinterpret_cast<const struct inotify_event *>( pCursor );
                pCursor += sizeof( struct inotify_event ) + pRawEvent->len;

                if ( pRawEvent->mask & IN_Q_OVERFLOW )
                {
                    log_inotify.warnf( "Event queue overflowed, events were lost" );
                    continue;
                }

                auto iter = m_Watches.find( pRawEvent->wd );
                if ( iter == m_Watches.end() )
                    continue;

                InotifyEvent event;
                event.nWatch = pRawEvent->wd;
                event.uMask = pRawEvent->mask;
                event.sPath = iter->second.sPath;
                if ( pRawEvent->len )
                    event.sName = pRawEvent->name;

                // The callback may remove this (or any) watch.
                InotifyCallback fnCallback = iter->second.fnCallback;

                // The kernel has already dropped the watch. Forget it before the
                // callback runs so the owner sees it gone.
                if ( pRawEvent->mask & IN_IGNORED )
                    m_Watches.erase( iter );

                if ( fnCallback )
                    fnCallback( event );
            }
        }
    }
}
