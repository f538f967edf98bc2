#include "Inhibitor.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

#include "log.hpp"
#include "Utils/Defer.h"

namespace fs = std::filesystem;

namespace dsinhibit
{
    static LogScope log_inhibitor( "Inhibitor" );

    static bool StartsWith( const std::string &sValue, const char *pszPrefix )
    {
        return sValue.compare( 0, strlen( pszPrefix ), pszPrefix ) == 0;
    }

    static bool HasEntryWithPrefix( const fs::path &dirPath, const char *pszPrefix )
    {
        std::error_code ec;
        for ( fs::directory_iterator it( dirPath, ec ), end; !ec && it != end; it.increment( ec ) )
        {
            if ( StartsWith( it->path().filename().string(), pszPrefix ) )
                return true;
        }
        return false;
    }

    CInhibitor::CInhibitor( std::string sSysfsRoot, std::vector<std::string> vecDrivers )
        : m_sSysfsRoot( std::move( sSysfsRoot ) )
        , m_vecDrivers( std::move( vecDrivers ) )
    {
    }

    std::string CInhibitor::GetDevicePath( uint32_t uHidrawId ) const
    {
        return m_sSysfsRoot + "/class/hidraw/hidraw" + std::to_string( uHidrawId ) + "/device";
    }

    std::vector<std::string> CInhibitor::GetNodes( uint32_t uHidrawId ) const
    {
        std::vector<std::string> vecNodes;

        std::error_code ec;
        fs::path inputDir = fs::path( GetDevicePath( uHidrawId ) ) / "input";
        for ( fs::directory_iterator it( inputDir, ec ), end; !ec && it != end; it.increment( ec ) )
        {
            std::string sName = it->path().filename().string();
            if ( !StartsWith( sName, "input" ) )
                continue;

            if ( !HasEntryWithPrefix( it->path(), "mouse" ) )
                continue;

            vecNodes.push_back( ( it->path() / "inhibited" ).string() );
        }

        std::sort( vecNodes.begin(), vecNodes.end() );
        return vecNodes;
    }

    std::string CInhibitor::GetDriverName( uint32_t uHidrawId ) const
    {
        std::error_code ec;
        fs::path driverLink = fs::read_symlink( GetDevicePath( uHidrawId ) + "/driver", ec );
        if ( ec )
            return std::string();

        return driverLink.filename().string();
    }

    bool CInhibitor::CanInhibit( uint32_t uHidrawId ) const
    {
        log_inhibitor.debugf( "Checking if hidraw%u can be inhibited", uHidrawId );

        std::string sDriver = GetDriverName( uHidrawId );
        if ( sDriver.empty() ||
             std::find( m_vecDrivers.begin(), m_vecDrivers.end(), sDriver ) == m_vecDrivers.end() )
        {
            log_inhibitor.debugf( "Not a PlayStation controller" );
            return false;
        }

        std::vector<std::string> vecNodes = GetNodes( uHidrawId );
        if ( vecNodes.empty() )
        {
            log_inhibitor.debugf( "No nodes to inhibit" );
            return false;
        }

        for ( const std::string &sNode : vecNodes )
        {
            if ( access( sNode.c_str(), W_OK ) != 0 )
            {
                log_inhibitor.debugf( "Node %s cannot be inhibited", sNode.c_str() );
                return false;
            }
            log_inhibitor.debugf( "Node %s can be inhibited", sNode.c_str() );
        }

        return true;
    }

    bool CInhibitor::WriteNodes( uint32_t uHidrawId, const char *pszValue ) const
    {
        bool bSuccess = true;
        size_t uLength = strlen( pszValue );

        for ( const std::string &sNode : GetNodes( uHidrawId ) )
        {
            int fd = open( sNode.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC );
            if ( fd < 0 )
            {
                log_inhibitor.warnf( "Failed to open %s: %s", sNode.c_str(), strerror( errno ) );
                bSuccess = false;
                continue;
            }
            defer( close( fd ) );

            ssize_t nWritten = write( fd, pszValue, uLength );
            if ( nWritten != (ssize_t)uLength )
            {
                log_inhibitor.warnf( "Failed to write %s: %s", sNode.c_str(),
                                     nWritten < 0 ? strerror( errno ) : "short write" );
                bSuccess = false;
            }
        }

        return bSuccess;
    }

    bool CInhibitor::Inhibit( uint32_t uHidrawId ) const
    {
        return WriteNodes( uHidrawId, "1\n" );
    }

    bool CInhibitor::Uninhibit( uint32_t uHidrawId ) const
    {
        return WriteNodes( uHidrawId, "0\n" );
    }
}
