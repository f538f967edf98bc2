#include "InhibitionServer.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sys/inotify.h>
#include <thread>

#include "log.hpp"
#include "SignalHandler.h"

namespace fs = std::filesystem;

namespace dsinhibit
{
    static LogScope log_server( "Server" );

    static constexpr uint32_t k_uHidrawWatchMask = IN_DELETE_SELF | IN_OPEN | IN_CLOSE_NOWRITE | IN_CLOSE_WRITE;
    static constexpr std::string_view k_svHidrawPrefix = "hidraw";

    CInhibitionServer::CInhibitionServer( DaemonOptions options )
        : m_Options( std::move( options ) )
        , m_Inhibitor( m_Options.sSysfsRoot, m_Options.vecDrivers )
        , m_ProcessScanner( m_Options.sProcRoot )
    {
    }

    CInhibitionServer::~CInhibitionServer()
    {
        if ( m_bRunning )
            Stop();
    }

    std::optional<uint32_t> CInhibitionServer::ParseHidrawId( std::string_view svDevNode ) const
    {
        // <dev>/hidraw<digits>
        std::string_view svDevRoot = m_Options.sDevRoot;
        if ( svDevNode.substr( 0, svDevRoot.size() ) != svDevRoot )
            return std::nullopt;
        svDevNode.remove_prefix( svDevRoot.size() );

        if ( svDevNode.empty() || svDevNode.front() != '/' )
            return std::nullopt;
        svDevNode.remove_prefix( 1 );

        if ( svDevNode.substr( 0, k_svHidrawPrefix.size() ) != k_svHidrawPrefix )
            return std::nullopt;
        svDevNode.remove_prefix( k_svHidrawPrefix.size() );

        if ( svDevNode.empty() || svDevNode.size() > 9 ||
             !std::all_of( svDevNode.begin(), svDevNode.end(), []( char c ) { return c >= '0' && c <= '9'; } ) )
            return std::nullopt;

        uint32_t uId = 0;
        for ( char c : svDevNode )
            uId = uId * 10 + uint32_t( c - '0' );
        return uId;
    }

    bool CInhibitionServer::IsWatched( const std::string &sDevNode ) const
    {
        return std::any_of( m_WatchedNodes.begin(), m_WatchedNodes.end(),
            [&]( const auto &entry ) { return entry.second == sDevNode; } );
    }

    std::vector<std::string> CInhibitionServer::GetWatchedNodes() const
    {
        std::vector<std::string> vecNodes;
        for ( const auto &[ nWatch, sDevNode ] : m_WatchedNodes )
            vecNodes.push_back( sDevNode );
        std::sort( vecNodes.begin(), vecNodes.end() );
        return vecNodes;
    }

    bool CInhibitionServer::Watch( const std::string &sDevNode )
    {
        std::optional<uint32_t> uId = ParseHidrawId( sDevNode );
        if ( !uId )
        {
            log_server.debugf( "New node %s is not a hidraw", sDevNode.c_str() );
            return false;
        }

        if ( IsWatched( sDevNode ) )
        {
            log_server.debugf( "%s is already on the watchlist", sDevNode.c_str() );
            return true;
        }

        if ( !m_Inhibitor.CanInhibit( *uId ) )
            return false;

        log_server.infof( "Adding %s to watchlist", sDevNode.c_str() );

        int nWatch = m_Inotify.AddWatch( sDevNode, k_uHidrawWatchMask,
            [this]( const InotifyEvent &event ) { OnHidrawEvent( event ); } );
        if ( nWatch < 0 )
            return false;

        m_WatchedNodes[nWatch] = sDevNode;
        Check( sDevNode );
        return true;
    }

    void CInhibitionServer::Check( const std::string &sDevNode )
    {
        std::optional<uint32_t> uId = ParseHidrawId( sDevNode );
        if ( !uId )
            return;

        if ( m_ProcessScanner.IsHeldBy( sDevNode, m_Options.vecProcessNames ) )
        {
            log_server.infof( "Inhibiting %s", sDevNode.c_str() );
            m_Inhibitor.Inhibit( *uId );
        }
        else
        {
            log_server.infof( "Uninhibiting %s", sDevNode.c_str() );
            m_Inhibitor.Uninhibit( *uId );
        }
    }

    void CInhibitionServer::OnNodeAdded( const std::string &sDevNode )
    {
        log_server.debugf( "New device %s found", sDevNode.c_str() );

        // Give the controller's input devices time to enumerate.
        if ( m_Options.settleDelay.count() > 0 )
            std::this_thread::sleep_for( m_Options.settleDelay );

        Watch( sDevNode );
    }

    void CInhibitionServer::OnHidrawEvent( const InotifyEvent &event )
    {
        // A lone IN_IGNORED means the IN_DELETE_SELF was lost (queue overflow).
        if ( event.uMask & ( IN_DELETE_SELF | IN_IGNORED ) )
        {
            log_server.debugf( "Device %s removed", event.sPath.c_str() );
            m_WatchedNodes.erase( event.nWatch );
            m_Inotify.RemoveWatch( event.nWatch );
            return;
        }

        Check( event.sPath );
    }

    std::vector<std::string> CInhibitionServer::ListDevRoot() const
    {
        std::vector<std::string> vecDevNodes;

        std::error_code ec;
        for ( fs::directory_iterator it( m_Options.sDevRoot, ec ), end; !ec && it != end; it.increment( ec ) )
        {
            std::string sName = it->path().filename().string();
            if ( sName.compare( 0, k_svHidrawPrefix.size(), k_svHidrawPrefix ) == 0 )
                vecDevNodes.push_back( m_Options.sDevRoot + "/" + sName );
        }

        if ( ec )
            log_server.warnf( "Failed to list %s: %s", m_Options.sDevRoot.c_str(), ec.message().c_str() );

        std::sort( vecDevNodes.begin(), vecDevNodes.end() );
        return vecDevNodes;
    }

    bool CInhibitionServer::StartDiscovery()
    {
        if ( m_Options.eDiscovery == DiscoveryMode::Udev )
        {
            m_pUdevMonitor = std::make_unique<CUdevMonitor>();
            if ( !m_pUdevMonitor->Init( "hidraw",
                    [this]( const std::string &sDevNode ) { OnNodeAdded( sDevNode ); } ) )
            {
                m_pUdevMonitor.reset();
                return false;
            }

            if ( !m_Waiter.AddWaitable( m_pUdevMonitor.get() ) )
                return false;

            for ( const std::string &sDevNode : m_pUdevMonitor->EnumerateDevNodes() )
                Watch( sDevNode );
        }
        else
        {
            int nWatch = m_Inotify.AddWatch( m_Options.sDevRoot, IN_CREATE,
                [this]( const InotifyEvent &event )
                {
                    if ( event.uMask & IN_CREATE )
                        OnNodeAdded( event.GetPathName() );
                } );
            if ( nWatch < 0 )
                return false;

            for ( const std::string &sDevNode : ListDevRoot() )
                Watch( sDevNode );
        }

        return true;
    }

    bool CInhibitionServer::Start()
    {
        log_server.infof( "Starting server" );

        if ( !m_Inotify.Init() )
            return false;

        if ( !m_Waiter.AddWaitable( &m_Inotify ) )
            return false;

        if ( !StartDiscovery() )
            return false;

        m_bRunning = true;
        return true;
    }

    void CInhibitionServer::Stop()
    {
        log_server.infof( "Stopping server" );

        for ( const auto &[ nWatch, sDevNode ] : m_WatchedNodes )
        {
            if ( std::optional<uint32_t> uId = ParseHidrawId( sDevNode ) )
                m_Inhibitor.Uninhibit( *uId );
            m_Inotify.RemoveWatch( nWatch );
        }
        m_WatchedNodes.clear();

        if ( m_pUdevMonitor )
        {
            m_Waiter.RemoveWaitable( m_pUdevMonitor.get() );
            m_pUdevMonitor.reset();
        }

        m_bRunning = false;
    }

    int CInhibitionServer::Serve()
    {
        CSignalHandler signalHandler;
        if ( !signalHandler.Init( { SIGINT, SIGTERM }, [this]( int nSignal )
            {
                log_server.debugf( "Shutting down on %s", strsignal( nSignal ) );
                m_Waiter.Shutdown();
            } ) )
        {
            return EXIT_FAILURE;
        }

        if ( !m_Waiter.AddWaitable( &signalHandler ) )
            return EXIT_FAILURE;

        if ( !Start() )
        {
            // Undo whatever was applied before discovery failed.
            Stop();
            m_Waiter.RemoveWaitable( &signalHandler );
            return EXIT_FAILURE;
        }

        bool bSuccess = m_Waiter.Run();

        Stop();
        m_Waiter.RemoveWaitable( &signalHandler );

        return bSuccess ? EXIT_SUCCESS : EXIT_FAILURE;
    }
}
