#include <unordered_set>

#include "CRecordMerger.hpp"

namespace lap
{
namespace tks
{
    core::Bool CRecordMerger::hasKey( const Record& record ) const noexcept
    {
        if ( !record.is_object() ) return false;

        auto it = record.find( m_layout.keyField );
        return it != record.end() && !it->is_null();
    }

    Record CRecordMerger::StripSession( const Record& record ) const
    {
        Record plain = record;
        if ( plain.is_object() ) {
            plain.erase( m_layout.sessionField );
        }
        return plain;
    }

    RecordList CRecordMerger::StripSession( const RecordList& records ) const
    {
        RecordList plain;
        plain.reserve( records.size() );

        for ( const auto& record : records ) {
            plain.emplace_back( StripSession( record ) );
        }
        return plain;
    }

    core::Bool CRecordMerger::applyUpdate( RecordList& full, const Record& update ) const
    {
        if ( !hasKey( update ) ) {
            LAP_TKS_LOG_WARN << "CRecordMerger::applyUpdate ignores a record without key field '" << m_layout.keyField << "'";
            return false;
        }

        const auto& key = update[ m_layout.keyField ];

        for ( auto& target : full ) {
            if ( !hasKey( target ) || target[ m_layout.keyField ] != key ) continue;

            for ( auto it = update.begin(); it != update.end(); ++it ) {
                if ( it.key() == m_layout.sessionField ) continue;
                target[ it.key() ] = it.value();
            }
            return true;
        }

        return false;
    }

    MergeOutcome CRecordMerger::Merge( const RecordList& full, const RecordList& active,
                                       const Record& single, core::Bool bLastReadOk ) const
    {
        MergeOutcome outcome;

        if ( !bLastReadOk && full.empty() ) {
            LAP_TKS_LOG_WARN << "Store file could not be read, skipping merge to avoid overwriting it";
            outcome.status = MergeStatus::kSkipped;
            return outcome;
        }

        if ( full.empty() && !active.empty() ) {
            // store initialised from memory
            for ( const auto& record : active ) {
                if ( !record.is_object() ) {
                    LAP_TKS_LOG_WARN << "CRecordMerger::Merge drops a non-object active record";
                    ++outcome.unmatched;
                    continue;
                }
                outcome.records.emplace_back( StripSession( record ) );
                ++outcome.matched;
            }
            outcome.status = MergeStatus::kApplied;
            return outcome;
        }

        outcome.records = full;

        if ( !single.is_null() ) {
            if ( applyUpdate( outcome.records, single ) ) ++outcome.matched;
            else ++outcome.unmatched;
        } else {
            for ( const auto& record : active ) {
                if ( applyUpdate( outcome.records, record ) ) ++outcome.matched;
                else ++outcome.unmatched;
            }
        }

        if ( outcome.unmatched > 0 ) {
            LAP_TKS_LOG_DEBUG << "CRecordMerger::Merge left " << outcome.unmatched << " active record(s) without on-disk match";
        }

        outcome.status = MergeStatus::kApplied;
        return outcome;
    }

    core::Result<void> CRecordMerger::ValidateRecords( const RecordList& records ) const noexcept
    {
        using result = core::Result<void>;

        try {
            ::std::unordered_set< ::std::string > seen;

            for ( const auto& record : records ) {
                if ( !record.is_object() ) {
                    LAP_TKS_LOG_ERROR << "Record of type " << record.type_name() << " cannot be persisted";
                    return result::FromError( TksErrc::kInvalidRecord );
                }

                if ( !hasKey( record ) ) continue;

                if ( !seen.insert( record[ m_layout.keyField ].dump() ).second ) {
                    LAP_TKS_LOG_ERROR << "Duplicate record key in field '" << m_layout.keyField << "'";
                    return result::FromError( TksErrc::kDuplicateKey );
                }
            }
        } catch ( const nlohmann::json::exception& e ) {
            LAP_TKS_LOG_ERROR.logFormat( "CRecordMerger::ValidateRecords failed with exception: %s", e.what() );
            return result::FromError( TksErrc::kInvalidRecord );
        }

        return result::FromValue();
    }
} // namespace tks
} // namespace lap
