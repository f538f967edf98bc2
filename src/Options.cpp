#include "Options.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>

namespace dsinhibit
{
    static LogScope log_options( "Options" );

    enum
    {
        OPT_SETTLE_MS = 0x100,
        OPT_DISCOVERY,
        OPT_SYSFS_ROOT,
        OPT_DEV_ROOT,
        OPT_PROC_ROOT,
    };

    static const char s_szShortOptions[] = "hvqp:d:";

    static const struct option s_LongOptions[] =
    {
        { "help",        no_argument,       nullptr, 'h' },
        { "verbose",     no_argument,       nullptr, 'v' },
        { "quiet",       no_argument,       nullptr, 'q' },
        { "process",     required_argument, nullptr, 'p' },
        { "driver",      required_argument, nullptr, 'd' },
        { "settle-ms",   required_argument, nullptr, OPT_SETTLE_MS },
        { "discovery",   required_argument, nullptr, OPT_DISCOVERY },
        { "sysfs-root",  required_argument, nullptr, OPT_SYSFS_ROOT },
        { "dev-root",    required_argument, nullptr, OPT_DEV_ROOT },
        { "proc-root",   required_argument, nullptr, OPT_PROC_ROOT },
        { nullptr,       0,                 nullptr, 0 },
    };

    void PrintUsage( FILE *pFile, const char *pszArgv0 )
    {
        fprintf( pFile,
            "usage: %s [options]\n"
            "\n"
            "Inhibits the touchpad and motion sensors of PlayStation controllers\n"
            "while Steam holds their hidraw node open.\n"
            "\n"
            "  -v, --verbose               log debug messages\n"
            "  -q, --quiet                 only log warnings and errors\n"
            "  -p, --process NAME          process that triggers inhibition (default: steam)\n"
            "  -d, --driver NAME           HID driver to manage (default: sony, playstation)\n"
            "      --settle-ms MS          wait for new nodes to enumerate (default: 250)\n"
            "      --discovery MODE        udev or inotify (default: udev)\n"
            "      --sysfs-root PATH       (default: /sys)\n"
            "      --dev-root PATH         (default: /dev, needs --discovery=inotify)\n"
            "      --proc-root PATH        (default: /proc)\n"
            "  -h, --help                  show this help\n"
            "\n"
            "The DS_INHIBIT_LOG environment variable (debug, info, warning, error, silent)\n"
            "sets the log level when neither --verbose nor --quiet is given.\n",
            pszArgv0 );
    }

    static std::string StripTrailingSlashes( std::string sPath )
    {
        while ( sPath.size() > 1 && sPath.back() == '/' )
            sPath.pop_back();
        return sPath;
    }

    ParseResult ParseCommandLine( int argc, char **argv, DaemonOptions &options )
    {
        std::vector<std::string> vecProcessNames;
        std::vector<std::string> vecDrivers;
        std::optional<LogPriority> eCommandLinePriority;

        // Full reinitialisation so the parser can run more than once per process.
        optind = 0;
        opterr = 0;

        int nOpt;
        while ( ( nOpt = getopt_long( argc, argv, s_szShortOptions, s_LongOptions, nullptr ) ) != -1 )
        {
            switch ( nOpt )
            {
                case 'h':
                    return ParseResult::Help;
                case 'v':
                    eCommandLinePriority = LOG_DEBUG;
                    break;
                case 'q':
                    eCommandLinePriority = LOG_WARNING;
                    break;
                case 'p':
                    vecProcessNames.emplace_back( optarg );
                    break;
                case 'd':
                    vecDrivers.emplace_back( optarg );
                    break;
                case OPT_SETTLE_MS:
                {
                    char *pszEnd = nullptr;
                    errno = 0;
                    long nMs = strtol( optarg, &pszEnd, 10 );
                    if ( errno != 0 || pszEnd == optarg || *pszEnd != '\0' || nMs < 0 )
                    {
                        log_options.errorf( "Invalid settle delay '%s'", optarg );
                        return ParseResult::Error;
                    }
                    options.settleDelay = std::chrono::milliseconds( nMs );
                }
                break;
                case OPT_DISCOVERY:
                    if ( !strcmp( optarg, "udev" ) )
                        options.eDiscovery = DiscoveryMode::Udev;
                    else if ( !strcmp( optarg, "inotify" ) )
                        options.eDiscovery = DiscoveryMode::Inotify;
                    else
                    {
                        log_options.errorf( "Unknown discovery mode '%s'", optarg );
                        return ParseResult::Error;
                    }
                    break;
                case OPT_SYSFS_ROOT:
                    options.sSysfsRoot = StripTrailingSlashes( optarg );
                    break;
                case OPT_DEV_ROOT:
                    options.sDevRoot = StripTrailingSlashes( optarg );
                    break;
                case OPT_PROC_ROOT:
                    options.sProcRoot = StripTrailingSlashes( optarg );
                    break;
                default:
                    log_options.errorf( "Unrecognized option '%s'", argv[optind - 1] );
                    return ParseResult::Error;
            }
        }

        if ( optind < argc )
        {
            log_options.errorf( "Unexpected argument '%s'", argv[optind] );
            return ParseResult::Error;
        }

        // udev always reports nodes under /dev.
        if ( options.eDiscovery == DiscoveryMode::Udev && options.sDevRoot != "/dev" )
        {
            log_options.errorf( "--dev-root requires --discovery=inotify" );
            return ParseResult::Error;
        }

        if ( !vecProcessNames.empty() )
            options.vecProcessNames = std::move( vecProcessNames );
        if ( !vecDrivers.empty() )
            options.vecDrivers = std::move( vecDrivers );

        if ( eCommandLinePriority )
        {
            options.eLogPriority = eCommandLinePriority;
        }
        else if ( const char *pszEnvLevel = getenv( "DS_INHIBIT_LOG" ) )
        {
            options.eLogPriority = ParseLogPriority( pszEnvLevel );
            if ( !options.eLogPriority )
                log_options.warnf( "Ignoring unknown DS_INHIBIT_LOG level '%s'", pszEnvLevel );
        }

        return ParseResult::Run;
    }
}
