/**
 * @file CRecordMerger.hpp
 * @brief Reconciles an in-memory view of active records with the persisted set
 * @version 0.1
 * @date 2025-11-20
 *
 * Rules:
 * - records are matched by the key field only
 * - matched records are updated field by field, fields missing from the
 *   active record survive
 * - active records without an on-disk counterpart are never inserted
 * - on-disk records not mentioned by the active view are kept untouched
 * - the session field is never carried into the persisted set
 */
#ifndef LAP_TOKENSTORE_RECORDMERGER_HPP
#define LAP_TOKENSTORE_RECORDMERGER_HPP

#include <lap/core/CResult.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    struct MergeOutcome
    {
        MergeStatus                         status{ MergeStatus::kSkipped };
        RecordList                          records;
        core::UInt32                        matched{ 0 };
        core::UInt32                        unmatched{ 0 };
    };

    class CRecordMerger final
    {
    public:
        explicit CRecordMerger( const RecordLayout& layout ) noexcept
            : m_layout( layout )
        {
            ;
        }

        /**
         * @brief Compute the sequence to persist
         * @param full          Complete sequence currently on disk
         * @param active        Partial in-memory view, may carry the session field
         * @param single        When not null only this record is applied
         * @param bLastReadOk   Health of the read that produced full
         */
        MergeOutcome                        Merge( const RecordList& full, const RecordList& active,
                                                   const Record& single, core::Bool bLastReadOk ) const;

        /**
         * @brief Copy of record without the session field
         */
        Record                              StripSession( const Record& record ) const;
        RecordList                          StripSession( const RecordList& records ) const;

        /**
         * @brief Reject sequences that cannot be persisted
         * @return kInvalidRecord if an element is not a JSON object,
         *         kDuplicateKey on the first repeated key
         */
        core::Result<void>                  ValidateRecords( const RecordList& records ) const noexcept;

    private:
        core::Bool                          hasKey( const Record& record ) const noexcept;
        core::Bool                          applyUpdate( RecordList& full, const Record& update ) const;

    private:
        RecordLayout                        m_layout;
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_RECORDMERGER_HPP
