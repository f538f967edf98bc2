#pragma once

#include <functional>
#include <string>
#include <vector>

#include "waitable.h"

struct udev;
struct udev_monitor;

namespace dsinhibit
{
    // Enumerates hidraw devices and reports new ones through a udev monitor.
    class CUdevMonitor final : public IWaitable
    {
    public:
        using DeviceAddedCallback = std::function<void( const std::string &sDevNode )>;

        CUdevMonitor();
        ~CUdevMonitor();

        CUdevMonitor( const CUdevMonitor & ) = delete;
        CUdevMonitor &operator=( const CUdevMonitor & ) = delete;

        bool Init( const char *pszSubsystem, DeviceAddedCallback fnCallback );

        std::vector<std::string> EnumerateDevNodes() const;

        int GetFD() override;
        void OnPollIn() override;

    private:
        udev *m_pUdev = nullptr;
        udev_monitor *m_pMonitor = nullptr;
        std::string m_sSubsystem;
        DeviceAddedCallback m_fnCallback;
    };
}
