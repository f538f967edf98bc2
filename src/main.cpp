#include <cstdlib>
#include <cstdio>

#include "InhibitionServer.h"
#include "Options.h"
#include "log.hpp"

using namespace dsinhibit;

int main( int argc, char **argv )
{
    DaemonOptions options;

    switch ( ParseCommandLine( argc, argv, options ) )
    {
        case ParseResult::Help:
            PrintUsage( stdout, argv[0] );
            return EXIT_SUCCESS;
        case ParseResult::Error:
            PrintUsage( stderr, argv[0] );
            return EXIT_FAILURE;
        case ParseResult::Run:
            break;
    }

    if ( options.eLogPriority )
        SetLogPriority( *options.eLogPriority );

    CInhibitionServer server( std::move( options ) );
    return server.Serve();
}
