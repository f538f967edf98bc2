#include <functional>
#include <unistd.h>

#include <gtest/gtest.h>

#include "waitable.h"

namespace dsinhibit
{
    class CPipeWaitable final : public IWaitable
    {
    public:
        CPipeWaitable()
        {
            if ( pipe( m_nFDs ) != 0 )
                m_nFDs[0] = m_nFDs[1] = -1;
        }

        ~CPipeWaitable()
        {
            if ( m_nFDs[0] >= 0 )
                close( m_nFDs[0] );
            if ( m_nFDs[1] >= 0 )
                close( m_nFDs[1] );
        }

        void Signal()
        {
            char c = 'x';
            ASSERT_EQ( write( m_nFDs[1], &c, 1 ), 1 );
        }

        void CloseWriteEnd()
        {
            close( m_nFDs[1] );
            m_nFDs[1] = -1;
        }

        int GetFD() override { return m_nFDs[0]; }

        void OnPollIn() override
        {
            char c;
            if ( read( m_nFDs[0], &c, 1 ) == 1 )
                m_nPollIns++;
            if ( m_fnOnPollIn )
                m_fnOnPollIn();
        }

        void OnPollHangUp() override { m_nHangUps++; }

        int m_nFDs[2];
        int m_nPollIns = 0;
        int m_nHangUps = 0;
        std::function<void()> m_fnOnPollIn;
    };

    TEST( WaiterTest, DispatchesReadyWaitables )
    {
        CWaiter waiter;
        CPipeWaitable ready, idle;
        ASSERT_TRUE( waiter.AddWaitable( &ready ) );
        ASSERT_TRUE( waiter.AddWaitable( &idle ) );

        ready.Signal();
        EXPECT_TRUE( waiter.PollEvents( 0 ) );

        EXPECT_EQ( ready.m_nPollIns, 1 );
        EXPECT_EQ( idle.m_nPollIns, 0 );
    }

    TEST( WaiterTest, RemovedWaitableIsNotDispatched )
    {
        CWaiter waiter;
        CPipeWaitable waitable;
        ASSERT_TRUE( waiter.AddWaitable( &waitable ) );
        waiter.RemoveWaitable( &waitable );

        waitable.Signal();
        EXPECT_TRUE( waiter.PollEvents( 0 ) );
        EXPECT_EQ( waitable.m_nPollIns, 0 );
    }

    TEST( WaiterTest, RejectsWaitableWithoutFD )
    {
        CWaiter waiter;
        IWaitable empty;
        EXPECT_FALSE( waiter.AddWaitable( &empty ) );
        EXPECT_FALSE( waiter.AddWaitable( nullptr ) );
    }

    TEST( WaiterTest, HangUpIsReported )
    {
        CWaiter waiter;
        CPipeWaitable waitable;
        ASSERT_TRUE( waiter.AddWaitable( &waitable ) );

        waitable.CloseWriteEnd();
        EXPECT_TRUE( waiter.PollEvents( 0 ) );
        EXPECT_EQ( waitable.m_nHangUps, 1 );
    }

    TEST( WaiterTest, RunStopsOnShutdown )
    {
        CWaiter waiter;
        CPipeWaitable waitable;
        ASSERT_TRUE( waiter.AddWaitable( &waitable ) );
        waitable.m_fnOnPollIn = [&]() { waiter.Shutdown(); };

        waitable.Signal();
        EXPECT_TRUE( waiter.Run() );
        EXPECT_FALSE( waiter.IsRunning() );
        EXPECT_EQ( waitable.m_nPollIns, 1 );
    }
}
