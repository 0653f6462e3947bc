/**
 * @file CStoreBootstrap.hpp
 * @brief Store file creation, legacy migration and salt resolution
 * @version 0.1
 * @date 2025-11-20
 *
 * Guarantees that a readable store document exists before the store reads
 * or writes it:
 * - missing file          -> fresh { salt, tokens: [] }
 * - bare array (legacy)   -> wrapped as { salt, tokens: <array> } in place
 * - object without salt   -> salt injected in place
 *
 * The salt resolved here is cached for the lifetime of the instance. If the
 * file cannot be read or parsed a process-local salt is used instead and
 * nothing is persisted.
 */
#ifndef LAP_TOKENSTORE_STOREBOOTSTRAP_HPP
#define LAP_TOKENSTORE_STOREBOOTSTRAP_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "CStoreDocument.hpp"

namespace lap
{
namespace tks
{
    class CStoreBootstrap final
    {
    public:
        CStoreBootstrap( core::StringView strFile, const RecordLayout& layout,
                         core::Int32 indent, SaltGenerator saltGenerator ) noexcept;
        ~CStoreBootstrap() noexcept = default;

        /**
         * @brief Create the parent directory and a fresh document if the file is absent
         * @note An existing file is never replaced
         */
        core::Result<void>                      EnsureStoreExists() noexcept;

        /**
         * @brief Resolve the store salt, migrating the file when needed
         * @note Never fails; falls back to a non-persisted salt
         */
        core::String                            GetSalt() noexcept;

        /**
         * @brief Read the raw store file
         * @return kFileNotFound if absent, kPhysicalStorageFailure if unreadable
         */
        core::Result< core::String >            ReadStoreFile() const noexcept;

        core::Bool                              isSaltResolved() const noexcept;
        core::Bool                              isSaltPersisted() const noexcept;
        inline const core::String&              getFilePath() const noexcept            { return m_strFile; }

        CStoreBootstrap( const CStoreBootstrap& ) = delete;
        CStoreBootstrap& operator=( const CStoreBootstrap& ) = delete;

    private:
        core::Result< core::String >            resolveSalt() noexcept;
        core::Result< core::String >            generateSalt() const noexcept;
        core::Result<void>                      overwriteInPlace( const nlohmann::json& root ) noexcept;

    private:
        core::String                            m_strFile;
        RecordLayout                            m_layout;
        core::Int32                             m_indent;
        SaltGenerator                           m_saltGenerator;

        core::Mutex                             m_mtxCreate;
        mutable core::Mutex                     m_mtxSalt;
        core::String                            m_salt;
        core::Bool                              m_bSaltResolved{ false };
        core::Bool                              m_bSaltPersisted{ false };
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_STOREBOOTSTRAP_HPP
