#pragma once

#include <utility>

namespace dsinhibit
{
    template <typename Func>
    class CDeferHelper
    {
    public:
        explicit CDeferHelper( Func fnCallback )
            : m_fnCallback( std::move( fnCallback ) )
        {
        }

        ~CDeferHelper()
        {
            m_fnCallback();
        }

        CDeferHelper( const CDeferHelper & ) = delete;
        CDeferHelper &operator=( const CDeferHelper & ) = delete;

    private:
        Func m_fnCallback;
    };
}

#define DEFER_CONCAT_INNER( a, b ) a##b
#define DEFER_CONCAT( a, b ) DEFER_CONCAT_INNER( a, b )
#define defer( expr ) ::dsinhibit::CDeferHelper DEFER_CONCAT( _defer_, __LINE__ ){ [&]() { expr; } }
