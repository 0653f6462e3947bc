/**
 * @file CWriteSerializer.hpp
 * @brief Single-consumer FIFO pipeline for store mutations
 * @version 0.1
 * @date 2025-11-20
 *
 * Every submitted task is posted to a private io_context that is run by
 * exactly one looper thread, so tasks execute one at a time and in
 * submission order. Each task reports through its own future; a failing
 * task never affects the tasks queued after it.
 *
 * Stop() (and the destructor) stops accepting new tasks, lets the queued
 * ones finish and joins the looper.
 */
#ifndef LAP_TOKENSTORE_WRITESERIALIZER_HPP
#define LAP_TOKENSTORE_WRITESERIALIZER_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include <lap/core/CResult.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    namespace bio = ::boost::asio;

    class CWriteSerializer final
    {
    public:
        template< typename T >
        using Task      = ::std::function< core::Result< T >() >;

        template< typename T >
        using Future    = ::std::future< core::Result< T > >;

    public:
        explicit CWriteSerializer( core::StringView strName ) noexcept;
        ~CWriteSerializer() noexcept;

        /**
         * @brief Queue a task behind all previously submitted ones
         * @return future resolved with the task's result, or with
         *         kSerializerStopped if the pipeline no longer accepts work
         */
        template< typename T >
        Future< T >                             Submit( Task< T > task ) noexcept;

        /**
         * @brief Drain queued tasks and join the looper thread
         */
        void                                    Stop() noexcept;

        inline core::Bool                       isRunning() const noexcept          { return m_bRunning.load(); }
        inline core::UInt64                     getExecutedCount() const noexcept   { return m_uExecuted.load(); }

        CWriteSerializer( const CWriteSerializer& ) = delete;
        CWriteSerializer& operator=( const CWriteSerializer& ) = delete;

    private:
        void                                    innerLoop() noexcept;

        template< typename T >
        static void                             runTask( const Task< T >& task, ::std::promise< core::Result< T > >& promise ) noexcept;

    private:
        using _WorkGuard = bio::executor_work_guard< bio::io_context::executor_type >;

        core::String                            m_strName;
        ::std::unique_ptr< bio::io_context >    m_ioContext;
        ::std::unique_ptr< _WorkGuard >         m_workGuard;
        ::std::unique_ptr< ::std::thread >      m_tLooper;
        ::std::atomic< core::Bool >             m_bRunning{ false };
        ::std::atomic< core::UInt64 >           m_uExecuted{ 0 };
        core::Mutex                             m_mtxSubmit;
    };

    template< typename T >
    void CWriteSerializer::runTask( const Task< T >& task, ::std::promise< core::Result< T > >& promise ) noexcept
    {
        try {
            promise.set_value( task() );
        } catch ( const ::std::exception& e ) {
            LAP_TKS_LOG_ERROR.logFormat( "CWriteSerializer task failed with exception: %s", e.what() );
            promise.set_value( core::Result< T >::FromError( TksErrc::kOperationFailed ) );
        } catch ( ... ) {
            LAP_TKS_LOG_ERROR << "CWriteSerializer task failed with unknown exception";
            promise.set_value( core::Result< T >::FromError( TksErrc::kOperationFailed ) );
        }
    }

    template< typename T >
    CWriteSerializer::Future< T > CWriteSerializer::Submit( Task< T > task ) noexcept
    {
        auto promise = ::std::make_shared< ::std::promise< core::Result< T > > >();
        auto future  = promise->get_future();

        core::LockGuard lock( m_mtxSubmit );

        if ( !m_bRunning.load() || !task ) {
            LAP_TKS_LOG_WARN << "CWriteSerializer[" << m_strName << "] rejects task, serializer stopped or task empty";
            promise->set_value( core::Result< T >::FromError( m_bRunning.load() ? TksErrc::kInvalidArgument : TksErrc::kSerializerStopped ) );
            return future;
        }

        bio::post( *m_ioContext, [this, promise, task]() {
            runTask< T >( task, *promise );
            m_uExecuted.fetch_add( 1 );
        } );

        return future;
    }
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_WRITESERIALIZER_HPP
