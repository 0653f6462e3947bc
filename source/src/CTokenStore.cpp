/**
 * @file CTokenStore.cpp
 * @brief TokenStore read path, write pipeline and merge
 * @version 0.1
 * @date 2025-11-20
 */

#include "CTokenStore.hpp"
#include "CAtomicFileWriter.hpp"
#include "CSaltGenerator.hpp"
#include "CStoreDocument.hpp"

namespace lap
{
namespace tks
{
    TokenStore::TokenStore( core::StringView strFile, const TokenStoreConfig& config, SaltGenerator saltGenerator ) noexcept
        : m_strFile( strFile.data(), strFile.size() )
        , m_config( config )
        , m_layout( toLayout( config ) )
        , m_bootstrap( strFile, m_layout, config.jsonIndent,
                       saltGenerator ? ::std::move( saltGenerator ) : CSaltGenerator::Default() )
        , m_cache( ::std::chrono::milliseconds( config.cacheTtlMs ) )
        , m_merger( m_layout )
        , m_serializer( strFile )
    {
        LAP_TKS_LOG_DEBUG << "TokenStore opened: " << m_strFile;
    }

    TokenStore::~TokenStore() noexcept
    {
        Close();
    }

    void TokenStore::Close() noexcept
    {
        m_serializer.Stop();
    }

    core::String TokenStore::GetSalt() noexcept
    {
        return m_bootstrap.GetSalt();
    }

    RecordList TokenStore::ReadAll() noexcept
    {
        return readRecords().records;
    }

    TokenStore::ReadOutcome TokenStore::readRecords() noexcept
    {
        ReadOutcome outcome;
        if ( m_cache.GetFresh( outcome.records, outcome.bHealthy ) ) {
            return outcome;
        }

        const auto uGeneration = m_cache.Generation();

        auto ensureResult = m_bootstrap.EnsureStoreExists();
        if ( !ensureResult.HasValue() ) {
            LAP_TKS_LOG_WARN << "TokenStore::ReadAll cannot create store file: " << ensureResult.Error().Message().data();
        }

        auto content = m_bootstrap.ReadStoreFile();
        if ( content.HasValue() ) {
            auto decoded = CStoreDocument::Decode( content.Value(), m_layout );
            if ( decoded.HasValue() && decoded.Value().hasRecords() ) {
                m_cache.MarkReadHealthy( true );
                outcome.bHealthy = true;

                if ( !m_cache.StoreFromRead( decoded.Value().records, uGeneration ) ) {
                    // a write finished while we were reading, its value is newer
                    if ( m_cache.GetAny( outcome.records ) ) return outcome;
                }
                outcome.records = ::std::move( decoded.Value().records );
                return outcome;
            }

            if ( decoded.HasValue() ) {
                LAP_TKS_LOG_WARN << "TokenStore::ReadAll found no record sequence ("
                                 << shapeToString( decoded.Value().shape ) << "): " << m_strFile;
            } else {
                LAP_TKS_LOG_WARN << "TokenStore::ReadAll failed to decode store file: " << m_strFile;
            }
        } else {
            LAP_TKS_LOG_WARN << "TokenStore::ReadAll failed to read store file: " << m_strFile
                             << ": " << content.Error().Message().data();
        }

        m_cache.MarkReadHealthy( false );
        outcome.bHealthy = false;

        if ( m_cache.GetAny( outcome.records ) ) {
            // keep serving the last good value for another window
            m_cache.Touch();
            return outcome;
        }

        outcome.records.clear();
        return outcome;
    }

    TokenStore::WriteFuture TokenStore::WriteAll( RecordList records ) noexcept
    {
        auto pending = ::std::make_shared< RecordList >( ::std::move( records ) );

        return m_serializer.Submit< void >( [this, pending]() {
            return persist( *pending );
        } );
    }

    TokenStore::MergeFuture TokenStore::Merge( RecordList active, Record single ) noexcept
    {
        auto pendingActive = ::std::make_shared< RecordList >( ::std::move( active ) );
        auto pendingSingle = ::std::make_shared< Record >( ::std::move( single ) );

        return m_serializer.Submit< MergeStatus >( [this, pendingActive, pendingSingle]() {
            using result = core::Result< MergeStatus >;

            const auto full     = readRecords();
            const auto outcome  = m_merger.Merge( full.records, *pendingActive, *pendingSingle, full.bHealthy );

            if ( outcome.status == MergeStatus::kSkipped ) {
                return result::FromValue( MergeStatus::kSkipped );
            }

            auto persistResult = persist( outcome.records );
            if ( !persistResult.HasValue() ) {
                return result::FromError( persistResult.Error() );
            }

            LAP_TKS_LOG_DEBUG << "TokenStore::Merge applied " << outcome.matched << " record(s) to " << m_strFile;
            return result::FromValue( MergeStatus::kApplied );
        } );
    }

    void TokenStore::InvalidateCache() noexcept
    {
        m_cache.Invalidate();
    }

    RecordList TokenStore::NormalizeRecords( const nlohmann::json& value )
    {
        if ( !value.is_array() ) return RecordList();

        return RecordList( value.begin(), value.end() );
    }

    core::Result<void> TokenStore::persist( const RecordList& records ) noexcept
    {
        using result = core::Result<void>;

        const auto plain = m_merger.StripSession( records );

        auto validResult = m_merger.ValidateRecords( plain );
        if ( !validResult.HasValue() ) {
            return validResult;
        }

        auto ensureResult = m_bootstrap.EnsureStoreExists();
        if ( !ensureResult.HasValue() ) {
            return ensureResult;
        }

        auto content = CStoreDocument::Encode( m_bootstrap.GetSalt(), plain, m_layout, m_config.jsonIndent );
        if ( !content.HasValue() ) {
            return result::FromError( content.Error() );
        }

        auto writeResult = CAtomicFileWriter::Write( m_strFile, content.Value() );
        if ( !writeResult.HasValue() ) {
            LAP_TKS_LOG_ERROR << "TokenStore failed to persist " << plain.size() << " record(s) to "
                              << m_strFile << ": " << writeResult.Error().Message().data();
            return writeResult;
        }

        m_cache.Store( plain );
        m_cache.MarkReadHealthy( true );

        return result::FromValue();
    }
} // namespace tks
} // namespace lap
