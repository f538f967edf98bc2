#include <fcntl.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

#include "InotifyWatcher.h"
#include "test_util.h"

namespace dsinhibit
{
    class InotifyWatcherTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ASSERT_TRUE( m_Watcher.Init() );
            m_Tree.MakeDirs( "dev" );
        }

        test::CTempTree m_Tree;
        CInotifyWatcher m_Watcher;
        std::vector<InotifyEvent> m_vecEvents;
    };

    TEST_F( InotifyWatcherTest, ReportsCreatedEntries )
    {
        int nWatch = m_Watcher.AddWatch( m_Tree.Path( "dev" ), IN_CREATE,
            [this]( const InotifyEvent &event ) { m_vecEvents.push_back( event ); } );
        ASSERT_GE( nWatch, 0 );

        m_Tree.WriteFile( "dev/hidraw0", "" );
        m_Watcher.OnPollIn();

        ASSERT_EQ( m_vecEvents.size(), 1u );
        EXPECT_EQ( m_vecEvents[0].nWatch, nWatch );
        EXPECT_TRUE( m_vecEvents[0].uMask & IN_CREATE );
        EXPECT_EQ( m_vecEvents[0].sName, "hidraw0" );
        EXPECT_EQ( m_vecEvents[0].GetPathName(), m_Tree.Path( "dev/hidraw0" ) );
    }

    TEST_F( InotifyWatcherTest, ReportsOpenAndClose )
    {
        m_Tree.WriteFile( "dev/hidraw1", "" );
        int nWatch = m_Watcher.AddWatch( m_Tree.Path( "dev/hidraw1" ), IN_OPEN | IN_CLOSE_NOWRITE,
            [this]( const InotifyEvent &event ) { m_vecEvents.push_back( event ); } );
        ASSERT_GE( nWatch, 0 );

        int fd = open( m_Tree.Path( "dev/hidraw1" ).c_str(), O_RDONLY );
        ASSERT_GE( fd, 0 );
        close( fd );
        m_Watcher.OnPollIn();

        ASSERT_EQ( m_vecEvents.size(), 2u );
        EXPECT_TRUE( m_vecEvents[0].uMask & IN_OPEN );
        EXPECT_TRUE( m_vecEvents[1].uMask & IN_CLOSE_NOWRITE );
        EXPECT_EQ( m_vecEvents[1].sPath, m_Tree.Path( "dev/hidraw1" ) );
        EXPECT_EQ( m_vecEvents[1].GetPathName(), m_Tree.Path( "dev/hidraw1" ) );
    }

    TEST_F( InotifyWatcherTest, DeleteSelfDropsTheWatch )
    {
        m_Tree.WriteFile( "dev/hidraw2", "" );
        int nWatch = m_Watcher.AddWatch( m_Tree.Path( "dev/hidraw2" ), IN_DELETE_SELF,
            [this]( const InotifyEvent &event ) { m_vecEvents.push_back( event ); } );
        ASSERT_GE( nWatch, 0 );

        ASSERT_EQ( unlink( m_Tree.Path( "dev/hidraw2" ).c_str() ), 0 );
        m_Watcher.OnPollIn();

        // The kernel follows IN_DELETE_SELF with IN_IGNORED.
        ASSERT_EQ( m_vecEvents.size(), 2u );
        EXPECT_TRUE( m_vecEvents[0].uMask & IN_DELETE_SELF );
        EXPECT_TRUE( m_vecEvents[1].uMask & IN_IGNORED );
        EXPECT_EQ( m_vecEvents[1].sPath, m_Tree.Path( "dev/hidraw2" ) );
        EXPECT_FALSE( m_Watcher.HasWatch( nWatch ) );
    }

    TEST_F( InotifyWatcherTest, DroppedWatchIsReported )
    {
        m_Tree.WriteFile( "dev/hidraw4", "" );
        int nWatch = m_Watcher.AddWatch( m_Tree.Path( "dev/hidraw4" ), IN_OPEN,
            [this]( const InotifyEvent &event )
            {
                m_vecEvents.push_back( event );
                EXPECT_FALSE( m_Watcher.HasWatch( event.nWatch ) );
            } );
        ASSERT_GE( nWatch, 0 );
        EXPECT_EQ( m_Watcher.FindWatch( m_Tree.Path( "dev/hidraw4" ) ), nWatch );

        // Removed behind the watcher's back, as when the kernel drops it.
        ASSERT_EQ( inotify_rm_watch( m_Watcher.GetFD(), nWatch ), 0 );
        m_Watcher.OnPollIn();

        ASSERT_EQ( m_vecEvents.size(), 1u );
        EXPECT_TRUE( m_vecEvents[0].uMask & IN_IGNORED );
        EXPECT_EQ( m_Watcher.FindWatch( m_Tree.Path( "dev/hidraw4" ) ), -1 );
    }

    TEST_F( InotifyWatcherTest, RemoveWatchStopsEvents )
    {
        int nWatch = m_Watcher.AddWatch( m_Tree.Path( "dev" ), IN_CREATE,
            [this]( const InotifyEvent &event ) { m_vecEvents.push_back( event ); } );
        ASSERT_GE( nWatch, 0 );

        m_Watcher.RemoveWatch( nWatch );
        EXPECT_EQ( m_Watcher.GetWatchCount(), 0u );

        // No IN_IGNORED either, the removal was ours.
        m_Tree.WriteFile( "dev/hidraw3", "" );
        m_Watcher.OnPollIn();
        EXPECT_TRUE( m_vecEvents.empty() );
    }

    TEST_F( InotifyWatcherTest, MissingPathFails )
    {
        EXPECT_LT( m_Watcher.AddWatch( m_Tree.Path( "dev/missing" ), IN_OPEN, nullptr ), 0 );
    }

    TEST( InotifyWatcherInit, AddWatchBeforeInitFails )
    {
        CInotifyWatcher watcher;
        EXPECT_EQ( watcher.GetFD(), -1 );
        EXPECT_LT( watcher.AddWatch( "/tmp", IN_CREATE, nullptr ), 0 );
    }
}
