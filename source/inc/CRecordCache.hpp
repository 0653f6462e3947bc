/**
 * @file CRecordCache.hpp
 * @brief Time-bounded in-memory copy of the persisted record sequence
 * @version 0.1
 * @date 2025-11-20
 *
 * Holds the last record sequence read from or written to disk together with
 * the time it was stored, and the health flag of the last disk read.
 *
 * Thread Safety:
 * - All operations are thread-safe (internal mutex)
 */
#ifndef LAP_TOKENSTORE_RECORDCACHE_HPP
#define LAP_TOKENSTORE_RECORDCACHE_HPP

#include <chrono>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    class CRecordCache final
    {
    public:
        using Clock = ::std::chrono::steady_clock;

        explicit CRecordCache( ::std::chrono::milliseconds ttl ) noexcept
            : m_ttl( ttl )
        {
            ;
        }

        /**
         * @brief Copy out the cached sequence if it is younger than the TTL
         */
        core::Bool                  GetFresh( RecordList& out ) const noexcept;

        /**
         * @brief As GetFresh(), bFromDisk is false while a stale value is re-served
         *        after a failed read (see Touch())
         */
        core::Bool                  GetFresh( RecordList& out, core::Bool& bFromDisk ) const noexcept;

        /**
         * @brief Copy out the cached sequence regardless of age
         * @return false if nothing was ever cached
         */
        core::Bool                  GetAny( RecordList& out ) const noexcept;

        /**
         * @brief Replace the cached sequence after a successful write
         *
         * Starts a new generation; disk reads that began before this call
         * can no longer overwrite the cache.
         */
        void                        Store( const RecordList& records ) noexcept;

        /**
         * @brief Cache the result of a disk read started at generation uGeneration
         * @return false if a write was cached in the meantime (value dropped)
         */
        core::Bool                  StoreFromRead( const RecordList& records, core::UInt64 uGeneration ) noexcept;

        core::UInt64                Generation() const noexcept;

        /**
         * @brief Restart the validity window without changing the content
         *
         * The value is marked stale until the next Store() or StoreFromRead().
         */
        void                        Touch() noexcept;

        /**
         * @brief Expire the cached value so the next read goes to disk
         */
        void                        Invalidate() noexcept;

        core::Bool                  HasValue() const noexcept;

        void                        MarkReadHealthy( core::Bool bHealthy ) noexcept;
        core::Bool                  IsReadHealthy() const noexcept;

    private:
        core::Bool                  isFresh() const noexcept;

    private:
        const ::std::chrono::milliseconds   m_ttl;

        mutable core::Mutex                 m_mtxCache;
        RecordList                          m_records;
        core::Bool                          m_bHasValue{ false };
        core::Bool                          m_bExpired{ false };
        core::Bool                          m_bStale{ false };
        Clock::time_point                   m_cacheTime{};
        core::Bool                          m_bLastReadOk{ true };
        core::UInt64                        m_uGeneration{ 0 };
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_RECORDCACHE_HPP
