/**
 * @file CTokenStore.hpp
 * @brief Crash-consistent JSON store of token records
 * @version 0.1
 * @date 2025-11-20
 *
 * File Format:
 * ```json
 * {
 *   "salt": "<random hex>",
 *   "tokens": [
 *     { "refresh_token": "rt-1", "enable": true, ... }
 *   ]
 * }
 * ```
 *
 * Reads are served from a time-bounded cache and fall back to the last good
 * value when the file is unreadable or malformed. WriteAll() and Merge() are
 * queued on one FIFO pipeline per store and return futures; they are applied
 * one at a time in submission order.
 *
 * Thread Safety:
 * - All public methods may be called from any thread
 * - Mutations are serialized by the internal write pipeline, no file locks
 */
#ifndef LAP_TOKENSTORE_TOKENSTORE_HPP
#define LAP_TOKENSTORE_TOKENSTORE_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CStoreBootstrap.hpp"
#include "CRecordCache.hpp"
#include "CRecordMerger.hpp"
#include "CWriteSerializer.hpp"

namespace lap
{
namespace tks
{
    class TokenStore final
    {
    public:
        IMP_OPERATOR_NEW(TokenStore)

        using WriteFuture   = CWriteSerializer::Future< void >;
        using MergeFuture   = CWriteSerializer::Future< MergeStatus >;

    public:
        /**
         * @param strFile       Store file path
         * @param config        Record layout, cache window and JSON indent
         * @param saltGenerator Salt source, CSaltGenerator::Generate if empty
         */
        explicit TokenStore( core::StringView strFile,
                             const TokenStoreConfig& config = TokenStoreConfig(),
                             SaltGenerator saltGenerator = SaltGenerator() ) noexcept;
        ~TokenStore() noexcept;

        /**
         * @brief Store salt; created or migrated on first call
         */
        core::String                            GetSalt() noexcept;

        /**
         * @brief Complete record sequence, including disabled records
         * @note Never fails: returns the last good value or an empty sequence
         */
        RecordList                              ReadAll() noexcept;

        /**
         * @brief Replace the whole record sequence
         *
         * The session field is stripped from every record. Fails with
         * kInvalidRecord if an element is not an object and with
         * kDuplicateKey if two records share a key value.
         */
        WriteFuture                             WriteAll( RecordList records ) noexcept;

        /**
         * @brief Merge active in-memory records back into the file
         *
         * Only records already on disk are updated (matched by key field);
         * records absent from active stay as they are. If single is not null
         * only that record is applied.
         * @return kSkipped when the file could not be read and nothing is on disk
         */
        MergeFuture                             Merge( RecordList active, Record single = Record() ) noexcept;

        /**
         * @brief Drop the cache validity so the next ReadAll() hits the disk
         */
        void                                    InvalidateCache() noexcept;

        /**
         * @brief Finish queued writes and refuse new ones
         */
        void                                    Close() noexcept;

        /**
         * @brief Interpret a JSON value as a record sequence; non-arrays give an empty one
         */
        static RecordList                       NormalizeRecords( const nlohmann::json& value );

        inline core::Bool                       isReadHealthy() const noexcept          { return m_cache.IsReadHealthy(); }
        inline core::Bool                       isOpen() const noexcept                 { return m_serializer.isRunning(); }
        inline const core::String&              getFilePath() const noexcept            { return m_strFile; }
        inline const TokenStoreConfig&          getConfig() const noexcept              { return m_config; }

        TokenStore( const TokenStore& ) = delete;
        TokenStore& operator=( const TokenStore& ) = delete;

    private:
        struct ReadOutcome
        {
            RecordList                          records;
            core::Bool                          bHealthy{ true };   ///< records came from a good read or write
        };

        /**
         * @brief ReadAll() together with the health of that same read
         */
        ReadOutcome                             readRecords() noexcept;

        /**
         * @brief Encode and atomically write records, then refresh the cache
         * @note Runs on the write pipeline only
         */
        core::Result<void>                      persist( const RecordList& records ) noexcept;

    private:
        core::String                            m_strFile;
        TokenStoreConfig                        m_config;
        RecordLayout                            m_layout;
        CStoreBootstrap                         m_bootstrap;
        CRecordCache                            m_cache;
        CRecordMerger                           m_merger;
        CWriteSerializer                        m_serializer;       ///< Declared last: drained before the members it uses go away
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_TOKENSTORE_HPP
