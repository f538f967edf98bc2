#pragma once

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace dsinhibit
{
    // Finds which processes hold a device node open by walking /proc/<pid>/fd.
    class CProcessScanner
    {
    public:
        explicit CProcessScanner( std::string sProcRoot );

        std::vector<pid_t> FindHolders( const std::string &sDevNode ) const;

        // Contents of /proc/<pid>/comm without the trailing newline.
        std::optional<std::string> GetProcessName( pid_t nPid ) const;

        bool IsHeldBy( const std::string &sDevNode, const std::vector<std::string> &vecNames ) const;

    private:
        std::string m_sProcRoot;
    };
}
