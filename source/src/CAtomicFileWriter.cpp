/**
 * @file CAtomicFileWriter.cpp
 * @brief Temp-file + fsync + rename replacement of the store file
 * @version 0.1
 * @date 2025-11-20
 *
 * @note POSIX file descriptors are used here instead of core::File because the
 * temporary file has to be fsynced before it is renamed.
 */

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <functional>
#include <random>
#include <thread>

#include <lap/core/CCrypto.hpp>
#include "CAtomicFileWriter.hpp"

namespace lap
{
namespace tks
{
    namespace
    {
        core::String parentDirectory( const core::String& path ) noexcept
        {
            auto lastSlashPos = path.rfind( '/' );
            if ( lastSlashPos == core::String::npos ) return ".";
            if ( lastSlashPos == 0 ) return "/";

            return path.substr( 0, lastSlashPos );
        }

        core::String baseName( const core::String& path ) noexcept
        {
            auto lastSlashPos = path.rfind( '/' );
            if ( lastSlashPos == core::String::npos ) return path;

            return path.substr( lastSlashPos + 1 );
        }
    }

    int  (*CAtomicFileWriter::s_pfnRename)( const char*, const char* )  = &::rename;
    int  (*CAtomicFileWriter::s_pfnUnlink)( const char* )               = &::unlink;

    core::String CAtomicFileWriter::makeTempPath( core::StringView strPath ) noexcept
    {
        core::String target( strPath.data(), strPath.size() );

        auto epochMs = ::std::chrono::duration_cast< ::std::chrono::milliseconds >(
                            ::std::chrono::system_clock::now().time_since_epoch() ).count();

        // uniqueness only, the name is not a secret
        thread_local ::std::mt19937_64 engine(
            static_cast< core::UInt64 >( ::std::chrono::steady_clock::now().time_since_epoch().count() )
            ^ static_cast< core::UInt64 >( ::std::hash< ::std::thread::id >()( ::std::this_thread::get_id() ) ) );

        core::UInt64 value = engine();
        core::UInt8 random[8];
        for ( auto& byte : random ) {
            byte    = static_cast< core::UInt8 >( value & 0xFF );
            value >>= 8;
        }

        core::String tempName = "." + baseName( target )
                                + "." + ::std::to_string( ::getpid() )
                                + "." + ::std::to_string( epochMs )
                                + "." + core::Crypto::Util::bytesToHex( random, sizeof( random ) )
                                + ".tmp";

        return parentDirectory( target ) + "/" + tempName;
    }

    core::Result<void> CAtomicFileWriter::Write( core::StringView strPath, core::StringView strContent ) noexcept
    {
        using result = core::Result<void>;

        if ( strPath.empty() ) return result::FromError( TksErrc::kInvalidArgument );

        core::String targetPath( strPath.data(), strPath.size() );
        core::String tempPath = makeTempPath( targetPath );

        auto writeResult = writeAndSync( tempPath, strContent );
        if ( !writeResult.HasValue() ) {
            removeTemp( tempPath );
            return writeResult;
        }

        auto renameResult = renameOnto( tempPath, targetPath );
        if ( !renameResult.HasValue() ) {
            removeTemp( tempPath );
            return renameResult;
        }

        syncDirectory( parentDirectory( targetPath ) );
        return result::FromValue();
    }

    core::Result< core::Bool > CAtomicFileWriter::Create( core::StringView strPath, core::StringView strContent ) noexcept
    {
        using result = core::Result< core::Bool >;

        if ( strPath.empty() ) return result::FromError( TksErrc::kInvalidArgument );

        core::String targetPath( strPath.data(), strPath.size() );
        core::String tempPath = makeTempPath( targetPath );

        auto writeResult = writeAndSync( tempPath, strContent );
        if ( !writeResult.HasValue() ) {
            removeTemp( tempPath );
            return result::FromError( writeResult.Error() );
        }

        core::Bool bCreated = true;
        if ( ::link( tempPath.c_str(), targetPath.c_str() ) != 0 ) {
            int linkErrno = errno;
            if ( linkErrno != EEXIST ) {
                LAP_TKS_LOG_ERROR << "Cannot link " << tempPath << " to " << targetPath << ": " << ::std::strerror( linkErrno );
                removeTemp( tempPath );
                return result::FromError( TksErrc::kRenameFailed );
            }
            bCreated = false;
        }

        removeTemp( tempPath );
        if ( bCreated ) syncDirectory( parentDirectory( targetPath ) );

        return result::FromValue( bCreated );
    }

    core::Result<void> CAtomicFileWriter::writeAndSync( const core::String& tempPath, core::StringView strContent ) noexcept
    {
        using result = core::Result<void>;

        int fd = ::open( tempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644 );
        if ( fd < 0 ) {
            int savedErrno = errno;
            LAP_TKS_LOG_ERROR.logFormat( "CAtomicFileWriter::writeAndSync cannot create %s: %s", tempPath.c_str(), ::std::strerror( savedErrno ) );
            if ( savedErrno == EACCES || savedErrno == EPERM ) return result::FromError( TksErrc::kPermissionDenied );
            return result::FromError( TksErrc::kFileNotFound );
        }

        const core::Char* data  = strContent.data();
        core::Size remaining    = strContent.size();
        while ( remaining > 0 ) {
            ssize_t written = ::write( fd, data, remaining );
            if ( written < 0 ) {
                if ( errno == EINTR ) continue;

                LAP_TKS_LOG_ERROR.logFormat( "CAtomicFileWriter::writeAndSync write %s failed: %s", tempPath.c_str(), ::std::strerror( errno ) );
                ::close( fd );
                return result::FromError( TksErrc::kPhysicalStorageFailure );
            }
            data        += written;
            remaining   -= static_cast< core::Size >( written );
        }

        if ( ::fsync( fd ) != 0 ) {
            LAP_TKS_LOG_ERROR.logFormat( "CAtomicFileWriter::writeAndSync fsync %s failed: %s", tempPath.c_str(), ::std::strerror( errno ) );
            ::close( fd );
            return result::FromError( TksErrc::kPhysicalStorageFailure );
        }

        if ( ::close( fd ) != 0 ) {
            LAP_TKS_LOG_ERROR.logFormat( "CAtomicFileWriter::writeAndSync close %s failed: %s", tempPath.c_str(), ::std::strerror( errno ) );
            return result::FromError( TksErrc::kPhysicalStorageFailure );
        }

        return result::FromValue();
    }

    core::Result<void> CAtomicFileWriter::renameOnto( const core::String& tempPath, const core::String& targetPath ) noexcept
    {
        using result = core::Result<void>;

        if ( s_pfnRename( tempPath.c_str(), targetPath.c_str() ) == 0 ) {
            return result::FromValue();
        }

        int renameErrno = errno;
        if ( renameErrno != EEXIST && renameErrno != EPERM && renameErrno != EACCES ) {
            LAP_TKS_LOG_ERROR << "Atomic rename failed: " << ::std::strerror( renameErrno );
            return result::FromError( TksErrc::kRenameFailed );
        }

        // destination held in a way that blocks replace: drop it and retry once
        LAP_TKS_LOG_WARN << "Atomic rename blocked (" << ::std::strerror( renameErrno ) << "), removing " << targetPath << " and retrying";
        if ( s_pfnUnlink( targetPath.c_str() ) != 0 && errno != ENOENT ) {
            LAP_TKS_LOG_ERROR << "Cannot remove " << targetPath << " before retry: " << ::std::strerror( errno );
            return result::FromError( TksErrc::kRenameFailed );
        }

        if ( s_pfnRename( tempPath.c_str(), targetPath.c_str() ) != 0 ) {
            LAP_TKS_LOG_ERROR << "Atomic rename retry failed: " << ::std::strerror( errno );
            return result::FromError( TksErrc::kRenameFailed );
        }

        return result::FromValue();
    }

    void CAtomicFileWriter::syncDirectory( const core::String& dirPath ) noexcept
    {
        int fd = ::open( dirPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC );
        if ( fd < 0 ) {
            LAP_TKS_LOG_WARN << "Cannot open directory for fsync: " << dirPath;
            return;
        }

        if ( ::fsync( fd ) != 0 ) {
            LAP_TKS_LOG_WARN << "Directory fsync failed for " << dirPath << ": " << ::std::strerror( errno );
        }
        ::close( fd );
    }

    void CAtomicFileWriter::removeTemp( const core::String& tempPath ) noexcept
    {
        if ( ::unlink( tempPath.c_str() ) != 0 && errno != ENOENT ) {
            LAP_TKS_LOG_WARN << "Failed to clean up temporary file " << tempPath << ": " << ::std::strerror( errno );
        }
    }
} // namespace tks
} // namespace lap
