#include "UdevMonitor.h"

#include <libudev.h>
#include <cerrno>
#include <cstring>

#include "log.hpp"
#include "Utils/Defer.h"

// udev is only used to discover nodes. Whether a node is a controller we
// manage is decided from sysfs by CInhibitor, the same way for every
// discovery mode.

namespace dsinhibit
{
    static LogScope log_udev( "Udev" );

    CUdevMonitor::CUdevMonitor()
    {
    }

    CUdevMonitor::~CUdevMonitor()
    {
        if ( m_pMonitor )
        {
            udev_monitor_unref( m_pMonitor );
            m_pMonitor = nullptr;
        }

        if ( m_pUdev )
        {
            udev_unref( m_pUdev );
            m_pUdev = nullptr;
        }
    }

    bool CUdevMonitor::Init( const char *pszSubsystem, DeviceAddedCallback fnCallback )
    {
        m_sSubsystem = pszSubsystem;
        m_fnCallback = std::move( fnCallback );

        m_pUdev = udev_new();
        if ( !m_pUdev )
        {
            log_udev.errorf( "Failed to create udev interface" );
            return false;
        }

        // "udev" rather than "kernel" so rules (and node permissions) have
        // been applied by the time we hear about a device.
        m_pMonitor = udev_monitor_new_from_netlink( m_pUdev, "udev" );
        if ( !m_pMonitor )
        {
            log_udev.errorf( "Failed to create udev monitor" );
            return false;
        }

        if ( udev_monitor_filter_add_match_subsystem_devtype( m_pMonitor, pszSubsystem, nullptr ) < 0 )
        {
            log_udev.errorf( "Failed to filter udev monitor on subsystem \"%s\"", pszSubsystem );
            return false;
        }

        if ( udev_monitor_enable_receiving( m_pMonitor ) < 0 )
        {
            log_udev.errorf( "Failed to enable udev monitor: %s", strerror( errno ) );
            return false;
        }

        log_udev.debugf( "Monitoring subsystem \"%s\"", pszSubsystem );
        return true;
    }

    std::vector<std::string> CUdevMonitor::EnumerateDevNodes() const
    {
        std::vector<std::string> vecDevNodes;
        if ( !m_pUdev )
            return vecDevNodes;

        udev_enumerate *pEnumerate = udev_enumerate_new( m_pUdev );
        if ( !pEnumerate )
        {
            log_udev.errorf( "Failed to create udev enumeration" );
            return vecDevNodes;
        }
        defer( udev_enumerate_unref( pEnumerate ) );

        udev_enumerate_add_match_subsystem( pEnumerate, m_sSubsystem.c_str() );
        if ( udev_enumerate_scan_devices( pEnumerate ) < 0 )
        {
            log_udev.errorf( "Failed to scan \"%s\" devices", m_sSubsystem.c_str() );
            return vecDevNodes;
        }

        udev_list_entry *pEntry;
        udev_list_entry_foreach( pEntry, udev_enumerate_get_list_entry( pEnumerate ) )
        {
            const char *pszSysPath = udev_list_entry_get_name( pEntry );
            udev_device *pDevice = udev_device_new_from_syspath( m_pUdev, pszSysPath );
            if ( !pDevice )
                continue;
            defer( udev_device_unref( pDevice ) );

            if ( const char *pszDevNode = udev_device_get_devnode( pDevice ) )
                vecDevNodes.emplace_back( pszDevNode );
        }

        return vecDevNodes;
    }

    int CUdevMonitor::GetFD()
    {
        if ( !m_pMonitor )
            return -1;

        return udev_monitor_get_fd( m_pMonitor );
    }

    void CUdevMonitor::OnPollIn()
    {
        while ( udev_device *pDevice = udev_monitor_receive_device( m_pMonitor ) )
        {
            defer( udev_device_unref( pDevice ) );

            const char *pszAction = udev_device_get_action( pDevice );
            const char *pszDevNode = udev_device_get_devnode( pDevice );
            if ( !pszAction || !pszDevNode )
                continue;

            log_udev.debugf( "%s: %s", pszAction, pszDevNode );

            // Removal is picked up by the IN_DELETE_SELF watch on the node itself.
            if ( strcmp( pszAction, "add" ) != 0 )
                continue;

            if ( m_fnCallback )
                m_fnCallback( pszDevNode );
        }
    }
}
