#include <gtest/gtest.h>

#include "log.hpp"

namespace dsinhibit
{
    class LogScopeTest : public ::testing::Test
    {
    protected:
        void SetUp() override { m_eSaved = GetLogPriority(); }
        void TearDown() override { SetLogPriority( m_eSaved ); }

        LogPriority m_eSaved = LOG_INFO;
    };

    TEST_F( LogScopeTest, FormatsScopeAndLevel )
    {
        SetLogPriority( LOG_INFO );
        LogScope log( "Test" );

        testing::internal::CaptureStderr();
        log.infof( "Adding %s to watchlist", "/dev/hidraw3" );
        std::string sOutput = testing::internal::GetCapturedStderr();

        EXPECT_EQ( sOutput, "[ds-inhibit] Info: Test: Adding /dev/hidraw3 to watchlist\n" );
    }

    TEST_F( LogScopeTest, FiltersBelowThreshold )
    {
        SetLogPriority( LOG_WARNING );
        LogScope log( "Test" );

        EXPECT_TRUE( log.Enabled( LOG_ERROR ) );
        EXPECT_TRUE( log.Enabled( LOG_WARNING ) );
        EXPECT_FALSE( log.Enabled( LOG_INFO ) );
        EXPECT_FALSE( log.Enabled( LOG_DEBUG ) );

        testing::internal::CaptureStderr();
        log.debugf( "hidden" );
        log.infof( "hidden" );
        log.warnf( "shown %d", 1 );
        std::string sOutput = testing::internal::GetCapturedStderr();

        EXPECT_EQ( sOutput, "[ds-inhibit] Warn: Test: shown 1\n" );
    }

    TEST_F( LogScopeTest, SilentDisablesEverything )
    {
        SetLogPriority( LOG_SILENT );
        LogScope log( "Test" );

        testing::internal::CaptureStderr();
        log.errorf( "nothing" );
        EXPECT_EQ( testing::internal::GetCapturedStderr(), "" );
    }

    TEST( ParseLogPriority, KnownAndUnknownNames )
    {
        EXPECT_EQ( ParseLogPriority( "debug" ), LOG_DEBUG );
        EXPECT_EQ( ParseLogPriority( "info" ), LOG_INFO );
        EXPECT_EQ( ParseLogPriority( "warning" ), LOG_WARNING );
        EXPECT_EQ( ParseLogPriority( "error" ), LOG_ERROR );
        EXPECT_EQ( ParseLogPriority( "silent" ), LOG_SILENT );
        EXPECT_FALSE( ParseLogPriority( "loud" ).has_value() );
    }
}
