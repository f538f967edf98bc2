#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>

#include "waitable.h"

namespace dsinhibit
{
    struct InotifyEvent
    {
        int nWatch = -1;
        uint32_t uMask = 0;
        std::string sPath;      // Path the watch was added for.
        std::string sName;      // Entry name, for events on a watched directory.

        std::string GetPathName() const
        {
            return sName.empty() ? sPath : sPath + "/" + sName;
        }
    };

    // Callbacks also receive IN_IGNORED when the kernel drops a watch that
    // RemoveWatch() did not remove. The watch is already gone at that point.
    using InotifyCallback = std::function<void( const InotifyEvent & )>;

    class CInotifyWatcher final : public IWaitable
    {
    public:
        CInotifyWatcher();
        ~CInotifyWatcher();

        CInotifyWatcher( const CInotifyWatcher & ) = delete;
        CInotifyWatcher &operator=( const CInotifyWatcher & ) = delete;

        bool Init();

        // Returns the watch descriptor, or -1 on failure.
        int AddWatch( const std::string &sPath, uint32_t uMask, InotifyCallback fnCallback );
        void RemoveWatch( int nWatch );

        bool HasWatch( int nWatch ) const { return m_Watches.count( nWatch ) != 0; }
        int FindWatch( const std::string &sPath ) const;
        size_t GetWatchCount() const { return m_Watches.size(); }

        int GetFD() override { return m_nInotifyFD; }
        void OnPollIn() override;

    private:
        struct Watch
        {
            std::string sPath;
            InotifyCallback fnCallback;
        };

        int m_nInotifyFD = -1;
        std::unordered_map<int, Watch> m_Watches;
    };
}
