#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

#define DS_INHIBIT_PRINTF( fmt_idx, arg_idx ) __attribute__(( format( printf, fmt_idx, arg_idx ) ))

namespace dsinhibit
{
    enum LogPriority
    {
        LOG_SILENT,
        LOG_ERROR,
        LOG_WARNING,
        LOG_INFO,
        LOG_DEBUG,
    };

    // Global threshold shared by every scope.
    void SetLogPriority( LogPriority ePriority );
    LogPriority GetLogPriority();

    // "debug", "info", "warning", "error", "silent"
    std::optional<LogPriority> ParseLogPriority( std::string_view svName );

    class LogScope
    {
    public:
        explicit LogScope( std::string_view svName );

        bool Enabled( LogPriority ePriority ) const;

        void vlogf( LogPriority ePriority, const char *pszFmt, va_list args ) DS_INHIBIT_PRINTF( 3, 0 );
        void log( LogPriority ePriority, std::string_view svText );

        void errorf( const char *pszFmt, ... ) DS_INHIBIT_PRINTF( 2, 3 );
        void warnf( const char *pszFmt, ... ) DS_INHIBIT_PRINTF( 2, 3 );
        void infof( const char *pszFmt, ... ) DS_INHIBIT_PRINTF( 2, 3 );
        void debugf( const char *pszFmt, ... ) DS_INHIBIT_PRINTF( 2, 3 );

    private:
        std::string m_sName;
    };
}
