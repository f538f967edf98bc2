#include "ProcessScanner.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

#include "log.hpp"

namespace fs = std::filesystem;

namespace dsinhibit
{
    static LogScope log_scanner( "ProcessScanner" );

    static bool IsNumeric( const std::string &sName )
    {
        return !sName.empty() &&
               std::all_of( sName.begin(), sName.end(), []( unsigned char c ) { return isdigit( c ); } );
    }

    CProcessScanner::CProcessScanner( std::string sProcRoot )
        : m_sProcRoot( std::move( sProcRoot ) )
    {
    }

    std::vector<pid_t> CProcessScanner::FindHolders( const std::string &sDevNode ) const
    {
        std::vector<pid_t> vecHolders;

        std::error_code ec;
        for ( fs::directory_iterator it( m_sProcRoot, ec ), end; !ec && it != end; it.increment( ec ) )
        {
            std::string sPid = it->path().filename().string();
            if ( !IsNumeric( sPid ) )
                continue;

            fs::path fdDir = it->path() / "fd";
            if ( access( fdDir.c_str(), R_OK ) != 0 )
                continue;

            // Processes come and go while we walk, so every error here just skips.
            std::error_code fdEc;
            for ( fs::directory_iterator fdIt( fdDir, fdEc ), fdEnd; !fdEc && fdIt != fdEnd; fdIt.increment( fdEc ) )
            {
                std::error_code linkEc;
                fs::path target = fs::read_symlink( fdIt->path(), linkEc );
                if ( linkEc || target.empty() || target.string() != sDevNode )
                    continue;

                vecHolders.push_back( (pid_t)strtol( sPid.c_str(), nullptr, 10 ) );
                break;
            }
        }

        if ( ec )
            log_scanner.warnf( "Failed to list %s: %s", m_sProcRoot.c_str(), ec.message().c_str() );

        return vecHolders;
    }

    std::optional<std::string> CProcessScanner::GetProcessName( pid_t nPid ) const
    {
        std::ifstream commFile( m_sProcRoot + "/" + std::to_string( nPid ) + "/comm" );
        if ( !commFile )
            return std::nullopt;

        std::string sName( ( std::istreambuf_iterator<char>( commFile ) ), std::istreambuf_iterator<char>() );
        while ( !sName.empty() && isspace( (unsigned char)sName.back() ) )
            sName.pop_back();

        if ( sName.empty() )
            return std::nullopt;

        return sName;
    }

    bool CProcessScanner::IsHeldBy( const std::string &sDevNode, const std::vector<std::string> &vecNames ) const
    {
        for ( pid_t nPid : FindHolders( sDevNode ) )
        {
            std::optional<std::string> sName = GetProcessName( nPid );
            if ( !sName )
                continue;

            log_scanner.debugf( "%s is held by %s (%d)", sDevNode.c_str(), sName->c_str(), (int)nPid );

            if ( std::find( vecNames.begin(), vecNames.end(), *sName ) != vecNames.end() )
                return true;
        }
        return false;
    }
}
