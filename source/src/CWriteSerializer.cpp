#include <pthread.h>

#include "CWriteSerializer.hpp"

namespace lap
{
namespace tks
{
    CWriteSerializer::CWriteSerializer( core::StringView strName ) noexcept
        : m_strName( strName.data(), strName.size() )
        , m_ioContext{ ::std::make_unique< bio::io_context >( 1 ) }
    {
        m_workGuard = ::std::make_unique< _WorkGuard >( bio::make_work_guard( *m_ioContext ) );

        m_bRunning  = true;
        m_tLooper   = ::std::make_unique< ::std::thread >( &CWriteSerializer::innerLoop, this );
        pthread_setname_np( m_tLooper->native_handle(), "tks_writer" );

        LAP_TKS_LOG_DEBUG << "CWriteSerializer[" << m_strName << "] started";
    }

    CWriteSerializer::~CWriteSerializer() noexcept
    {
        Stop();
    }

    void CWriteSerializer::Stop() noexcept
    {
        {
            core::LockGuard lock( m_mtxSubmit );

            if ( !m_bRunning.load() ) return;
            m_bRunning = false;
        }

        // run() returns once the already posted tasks are done
        m_workGuard.reset();

        if ( m_tLooper && m_tLooper->joinable() ) {
            m_tLooper->join();
        }
        m_tLooper.reset();

        LAP_TKS_LOG_DEBUG << "CWriteSerializer[" << m_strName << "] stopped after " << m_uExecuted.load() << " task(s)";
    }

    void CWriteSerializer::innerLoop() noexcept
    {
        for ( ;; ) {
            try {
                m_ioContext->run();
                break;
            } catch ( const ::std::exception& e ) {
                // keep draining the queue
                LAP_TKS_LOG_ERROR.logFormat( "CWriteSerializer[%s] looper caught exception: %s", m_strName.c_str(), e.what() );
            }
        }
    }
} // namespace tks
} // namespace lap
