#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Inhibitor.h"
#include "InotifyWatcher.h"
#include "Options.h"
#include "ProcessScanner.h"
#include "UdevMonitor.h"
#include "waitable.h"

namespace dsinhibit
{
    // Watches PlayStation controller hidraw nodes and inhibits their
    // touchpad/motion input devices while one of the configured processes
    // (Steam) holds the node open.
    class CInhibitionServer
    {
    public:
        explicit CInhibitionServer( DaemonOptions options );
        ~CInhibitionServer();

        CInhibitionServer( const CInhibitionServer & ) = delete;
        CInhibitionServer &operator=( const CInhibitionServer & ) = delete;

        // Start(), poll until SIGINT/SIGTERM or a fatal error, then Stop().
        // Returns the process exit status.
        int Serve();

        bool Start();
        void Stop();

        // Adds a hidraw node to the watchlist if it belongs to a controller
        // we can inhibit, and applies the current state right away.
        bool Watch( const std::string &sDevNode );

        // Inhibits or uninhibits a node depending on who holds it open.
        void Check( const std::string &sDevNode );

        std::optional<uint32_t> ParseHidrawId( std::string_view svDevNode ) const;

        bool IsRunning() const { return m_bRunning; }
        bool IsWatched( const std::string &sDevNode ) const;
        std::vector<std::string> GetWatchedNodes() const;

        CWaiter &GetWaiter() { return m_Waiter; }
        CInotifyWatcher &GetInotifyWatcher() { return m_Inotify; }

    private:
        bool StartDiscovery();
        std::vector<std::string> ListDevRoot() const;

        void OnNodeAdded( const std::string &sDevNode );
        void OnHidrawEvent( const InotifyEvent &event );

        DaemonOptions m_Options;
        CInhibitor m_Inhibitor;
        CProcessScanner m_ProcessScanner;

        CWaiter m_Waiter;
        CInotifyWatcher m_Inotify;
        std::unique_ptr<CUdevMonitor> m_pUdevMonitor;

        // inotify watch descriptor -> hidraw device node
        std::map<int, std::string> m_WatchedNodes;
        bool m_bRunning = false;
    };
}
