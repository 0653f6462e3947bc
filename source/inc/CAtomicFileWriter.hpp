/**
 * @file CAtomicFileWriter.hpp
 * @brief Crash-safe replacement of a single file
 * @version 0.1
 * @date 2025-11-20
 *
 * The new content is written to a sibling temporary file, synced to stable
 * storage and renamed onto the target. Readers see either the old or the new
 * content, never a partial write.
 *
 * Temporary file name:
 * ```
 * {dir}/.{base}.{pid}.{epochMs}.{random}.tmp
 * ```
 */
#ifndef LAP_TOKENSTORE_ATOMICFILEWRITER_HPP
#define LAP_TOKENSTORE_ATOMICFILEWRITER_HPP

#include <cstdio>
#include <unistd.h>
#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    class CAtomicFileWriter final
    {
    public:
        /**
         * @brief Replace the content of strPath with strContent
         *
         * If rename() reports EEXIST, EPERM or EACCES the target is unlinked and
         * the rename retried once. On failure the temporary file is removed and
         * the target is left untouched.
         *
         * @return kFileNotFound        directory missing / temp file cannot be created
         *         kPhysicalStorageFailure  write or fsync failed
         *         kRenameFailed        rename (and retry) failed
         */
        static core::Result<void> Write( core::StringView strPath, core::StringView strContent ) noexcept;

        /**
         * @brief Create strPath with strContent unless it already exists
         *
         * The temporary file is hard-linked onto the target, so an existing
         * file is never replaced even when another writer created it a moment
         * earlier.
         *
         * @return true if the file was created, false if it already existed
         */
        static core::Result< core::Bool > Create( core::StringView strPath, core::StringView strContent ) noexcept;

        /**
         * @brief Build a unique temporary path next to strPath
         */
        static core::String makeTempPath( core::StringView strPath ) noexcept;

#ifdef UNIT_TEST
        using RenameFunc    = int (*)( const char*, const char* );
        using UnlinkFunc    = int (*)( const char* );

        /**
         * @brief Replace the rename()/unlink() used on the target path
         * @note Only available in test builds
         */
        static void setFileOpsForTesting( RenameFunc pfnRename, UnlinkFunc pfnUnlink ) noexcept {
            s_pfnRename = pfnRename ? pfnRename : &::rename;
            s_pfnUnlink = pfnUnlink ? pfnUnlink : &::unlink;
        }

        static void resetForTesting() noexcept {
            s_pfnRename = &::rename;
            s_pfnUnlink = &::unlink;
        }
#endif

    private:
        static core::Result<void> writeAndSync( const core::String& tempPath, core::StringView strContent ) noexcept;
        static core::Result<void> renameOnto( const core::String& tempPath, const core::String& targetPath ) noexcept;
        static void syncDirectory( const core::String& dirPath ) noexcept;
        static void removeTemp( const core::String& tempPath ) noexcept;

        CAtomicFileWriter() = delete;

    private:
        static int  (*s_pfnRename)( const char*, const char* );
        static int  (*s_pfnUnlink)( const char* );
    };
} // namespace tks
} // namespace lap

#endif // LAP_TOKENSTORE_ATOMICFILEWRITER_HPP
