#pragma once

#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"

namespace dsinhibit
{
    enum class DiscoveryMode
    {
        Udev,
        Inotify,
    };

    struct DaemonOptions
    {
        std::string sSysfsRoot = "/sys";
        std::string sDevRoot = "/dev";
        std::string sProcRoot = "/proc";

        std::vector<std::string> vecProcessNames = { "steam" };
        std::vector<std::string> vecDrivers = { "sony", "playstation" };

        std::chrono::milliseconds settleDelay{ 250 };
        DiscoveryMode eDiscovery = DiscoveryMode::Udev;

        // Unset when neither the command line nor DS_INHIBIT_LOG chose a level.
        std::optional<LogPriority> eLogPriority;
    };

    enum class ParseResult
    {
        Run,
        Help,
        Error,
    };

    ParseResult ParseCommandLine( int argc, char **argv, DaemonOptions &options );
    void PrintUsage( FILE *pFile, const char *pszArgv0 );
}
