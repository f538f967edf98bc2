#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <vector>

namespace dsinhibit
{
    static std::atomic<LogPriority> s_eLogPriority{ LOG_INFO };

    static const char *PriorityName( LogPriority ePriority )
    {
        switch ( ePriority )
        {
            case LOG_ERROR:   return "Error";
            case LOG_WARNING: return "Warn";
            case LOG_INFO:    return "Info";
            case LOG_DEBUG:   return "Debug";
            default:          return "";
        }
    }

    void SetLogPriority( LogPriority ePriority )
    {
        s_eLogPriority = ePriority;
    }

    LogPriority GetLogPriority()
    {
        return s_eLogPriority;
    }

    std::optional<LogPriority> ParseLogPriority( std::string_view svName )
    {
        if ( svName == "debug" )
            return LOG_DEBUG;
        if ( svName == "info" )
            return LOG_INFO;
        if ( svName == "warning" || svName == "warn" )
            return LOG_WARNING;
        if ( svName == "error" )
            return LOG_ERROR;
        if ( svName == "silent" )
            return LOG_SILENT;
        return std::nullopt;
    }

    LogScope::LogScope( std::string_view svName )
        : m_sName( svName )
    {
    }

    bool LogScope::Enabled( LogPriority ePriority ) const
    {
        return ePriority != LOG_SILENT && ePriority <= s_eLogPriority;
    }

    void LogScope::log( LogPriority ePriority, std::string_view svText )
    {
        if ( !Enabled( ePriority ) )
            return;

        fprintf( stderr, "[ds-inhibit] %s: %s: %.*s\n",
                 PriorityName( ePriority ), m_sName.c_str(), (int)svText.size(), svText.data() );
    }

    void LogScope::vlogf( LogPriority ePriority, const char *pszFmt, va_list args )
    {
        if ( !Enabled( ePriority ) )
            return;

        va_list argsCopy;
        va_copy( argsCopy, args );
        int nLength = vsnprintf( nullptr, 0, pszFmt, argsCopy );
        va_end( argsCopy );

        if ( nLength < 0 )
            return;

        std::vector<char> buffer( nLength + 1 );
        vsnprintf( buffer.data(), buffer.size(), pszFmt, args );
        log( ePriority, std::string_view( buffer.data(), nLength ) );
    }

#define LOG_SCOPE_IMPL( name, priority ) \
    void LogScope::name( const char *pszFmt, ... ) \
    { \
        va_list args; \
        va_start( args, pszFmt ); \
        vlogf( priority, pszFmt, args ); \
        va_end( args ); \
    }

    LOG_SCOPE_IMPL( errorf, LOG_ERROR )
    LOG_SCOPE_IMPL( warnf, LOG_WARNING )
    LOG_SCOPE_IMPL( infof, LOG_INFO )
    LOG_SCOPE_IMPL( debugf, LOG_DEBUG )

#undef LOG_SCOPE_IMPL
}
