#include "CRecordCache.hpp"

namespace lap
{
namespace tks
{
    core::Bool CRecordCache::isFresh() const noexcept
    {
        if ( !m_bHasValue || m_bExpired ) return false;

        return ( Clock::now() - m_cacheTime ) < m_ttl;
    }

    core::Bool CRecordCache::GetFresh( RecordList& out ) const noexcept
    {
        core::LockGuard lock( m_mtxCache );

        if ( !isFresh() ) return false;

        out = m_records;
        return true;
    }

    core::Bool CRecordCache::GetFresh( RecordList& out, core::Bool& bFromDisk ) const noexcept
    {
        core::LockGuard lock( m_mtxCache );

        if ( !isFresh() ) return false;

        out         = m_records;
        bFromDisk   = !m_bStale;
        return true;
    }

    core::Bool CRecordCache::GetAny( RecordList& out ) const noexcept
    {
        core::LockGuard lock( m_mtxCache );

        if ( !m_bHasValue ) return false;

        out = m_records;
        return true;
    }

    void CRecordCache::Store( const RecordList& records ) noexcept
    {
        core::LockGuard lock( m_mtxCache );

        m_records   = records;
        m_bHasValue = true;
        m_bExpired  = false;
        m_bStale    = false;
        m_cacheTime = Clock::now();
        ++m_uGeneration;
    }

    core::Bool CRecordCache::StoreFromRead( const RecordList& records, core::UInt64 uGeneration ) noexcept
    {
        core::LockGuard lock( m_mtxCache );

        if ( uGeneration != m_uGeneration ) return false;

        m_records   = records;
        m_bHasValue = true;
        m_bExpired  = false;
        m_bStale    = false;
        m_cacheTime = Clock::now();
        return true;
    }

    core::UInt64 CRecordCache::Generation() const noexcept
    {
        core::LockGuard lock( m_mtxCache );
        return m_uGeneration;
    }

    void CRecordCache::Touch() noexcept
    {
        core::LockGuard lock( m_mtxCache );

        if ( !m_bHasValue ) return;

        m_bExpired  = false;
        m_bStale    = true;
        m_cacheTime = Clock::now();
    }

    void CRecordCache::Invalidate() noexcept
    {
        core::LockGuard lock( m_mtxCache );

        m_bExpired = true;
    }

    core::Bool CRecordCache::HasValue() const noexcept
    {
        core::LockGuard lock( m_mtxCache );
        return m_bHasValue;
    }

    void CRecordCache::MarkReadHealthy( core::Bool bHealthy ) noexcept
    {
        core::LockGuard lock( m_mtxCache );
        m_bLastReadOk = bHealthy;
    }

    core::Bool CRecordCache::IsReadHealthy() const noexcept
    {
        core::LockGuard lock( m_mtxCache );
        return m_bLastReadOk;
    }
} // namespace tks
} // namespace lap
