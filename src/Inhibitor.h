#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dsinhibit
{
    // Toggles the sysfs "inhibited" attribute of the mouse-type input
    // children (touchpad, motion sensors) of a hidraw device.
    class CInhibitor
    {
    public:
        CInhibitor( std::string sSysfsRoot, std::vector<std::string> vecDrivers );

        // <sysfs>/class/hidraw/hidraw<id>/device/input/input*/inhibited for every
        // input child that exposes a mouse* handler, sorted.
        std::vector<std::string> GetNodes( uint32_t uHidrawId ) const;

        std::string GetDriverName( uint32_t uHidrawId ) const;

        bool CanInhibit( uint32_t uHidrawId ) const;

        bool Inhibit( uint32_t uHidrawId ) const;
        bool Uninhibit( uint32_t uHidrawId ) const;

    private:
        std::string GetDevicePath( uint32_t uHidrawId ) const;
        bool WriteNodes( uint32_t uHidrawId, const char *pszValue ) const;

        std::string m_sSysfsRoot;
        std::vector<std::string> m_vecDrivers;
    };
}
