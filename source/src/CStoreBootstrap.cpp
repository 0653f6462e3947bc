/**
 * @file CStoreBootstrap.cpp
 * @brief Store file creation, legacy migration and salt resolution
 * @version 0.1
 * @date 2025-11-20
 */

#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include "CStoreBootstrap.hpp"
#include "CAtomicFileWriter.hpp"
#include "CSaltGenerator.hpp"

namespace lap
{
namespace tks
{
    CStoreBootstrap::CStoreBootstrap( core::StringView strFile, const RecordLayout& layout,
                                      core::Int32 indent, SaltGenerator saltGenerator ) noexcept
        : m_strFile( strFile.data(), strFile.size() )
        , m_layout( layout )
        , m_indent( indent )
        , m_saltGenerator( ::std::move( saltGenerator ) )
    {
        ;
    }

    core::Result<void> CStoreBootstrap::EnsureStoreExists() noexcept
    {
        using result = core::Result<void>;

        auto lastSlashPos = m_strFile.rfind( '/' );
        if ( lastSlashPos != core::String::npos && lastSlashPos > 0 ) {
            core::String dirPath = m_strFile.substr( 0, lastSlashPos );
            if ( !core::Path::createDirectory( dirPath ) ) {
                // may already exist; the file write below reports real failures
                LAP_TKS_LOG_DEBUG << "CStoreBootstrap::EnsureStoreExists createDirectory returned false: " << dirPath;
            }
        }

        core::LockGuard lock( m_mtxCreate );

        if ( core::File::Util::exists( m_strFile.c_str() ) ) {
            return result::FromValue();
        }

        auto salt = generateSalt();
        if ( !salt.HasValue() ) {
            return result::FromError( salt.Error() );
        }

        auto content = CStoreDocument::Encode( salt.Value(), RecordList{}, m_layout, m_indent );
        if ( !content.HasValue() ) {
            return result::FromError( content.Error() );
        }

        // another process may create the file between exists() and here
        auto createResult = CAtomicFileWriter::Create( m_strFile, content.Value() );
        if ( !createResult.HasValue() ) {
            LAP_TKS_LOG_ERROR << "Failed to create store file: " << m_strFile;
            return result::FromError( createResult.Error() );
        }

        if ( createResult.Value() ) {
            LAP_TKS_LOG_INFO << "Created store file with a fresh salt: " << m_strFile;
        }
        return result::FromValue();
    }

    core::Result< core::String > CStoreBootstrap::ReadStoreFile() const noexcept
    {
        using result = core::Result< core::String >;

        if ( !core::File::Util::exists( m_strFile.c_str() ) ) {
            return result::FromError( TksErrc::kFileNotFound );
        }

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( m_strFile, fileData ) ) {
            LAP_TKS_LOG_WARN << "CStoreBootstrap::ReadStoreFile failed to read file: " << m_strFile;
            return result::FromError( TksErrc::kPhysicalStorageFailure );
        }

        return result::FromValue( core::String( fileData.begin(), fileData.end() ) );
    }

    core::String CStoreBootstrap::GetSalt() noexcept
    {
        core::LockGuard lock( m_mtxSalt );

        if ( m_bSaltResolved ) return m_salt;

        auto saltResult = resolveSalt();
        if ( saltResult.HasValue() ) {
            m_salt              = saltResult.Value();
            m_bSaltPersisted    = true;
        } else {
            LAP_TKS_LOG_ERROR << "Failed to resolve store salt for " << m_strFile
                              << ": " << saltResult.Error().Message().data()
                              << ", using a temporary salt for this process";
            auto temporary      = generateSalt();
            m_salt              = temporary.HasValue() ? temporary.Value() : CSaltGenerator::Fallback();
            m_bSaltPersisted    = false;
        }

        m_bSaltResolved = true;
        return m_salt;
    }

    core::Bool CStoreBootstrap::isSaltResolved() const noexcept
    {
        core::LockGuard lock( m_mtxSalt );
        return m_bSaltResolved;
    }

    core::Bool CStoreBootstrap::isSaltPersisted() const noexcept
    {
        core::LockGuard lock( m_mtxSalt );
        return m_bSaltPersisted;
    }

    core::Result< core::String > CStoreBootstrap::resolveSalt() noexcept
    {
        using result = core::Result< core::String >;

        auto ensureResult = EnsureStoreExists();
        if ( !ensureResult.HasValue() ) {
            return result::FromError( ensureResult.Error() );
        }

        auto content = ReadStoreFile();
        if ( !content.HasValue() ) {
            return result::FromError( content.Error() );
        }

        auto decoded = CStoreDocument::Decode( content.Value(), m_layout );
        if ( !decoded.HasValue() ) {
            return result::FromError( decoded.Error() );
        }

        auto& document = decoded.Value();

        switch ( document.shape ) {
        case DocumentShape::kLegacySequence:
        {
            auto salt = generateSalt();
            if ( !salt.HasValue() ) {
                return result::FromError( salt.Error() );
            }

            nlohmann::json migrated = nlohmann::json::object();
            migrated[ LAP_TKS_SALT_FIELD ]      = salt.Value();
            migrated[ m_layout.recordsField ]   = document.root;

            auto writeResult = overwriteInPlace( migrated );
            if ( !writeResult.HasValue() ) {
                return result::FromError( writeResult.Error() );
            }

            LAP_TKS_LOG_INFO << "Migrated legacy store file (" << document.records.size() << " records) to salted format: " << m_strFile;
            return result::FromValue( migrated[ LAP_TKS_SALT_FIELD ].get< ::std::string >() );
        }

        case DocumentShape::kDocument:
        case DocumentShape::kDocumentNoRecords:
        {
            if ( !document.salt.empty() ) {
                return result::FromValue( document.salt );
            }

            auto salt = generateSalt();
            if ( !salt.HasValue() ) {
                return result::FromError( salt.Error() );
            }

            nlohmann::json updated = document.root;
            updated[ LAP_TKS_SALT_FIELD ] = salt.Value();
            if ( !updated.contains( m_layout.recordsField ) ) {
                updated[ m_layout.recordsField ] = nlohmann::json::array();
            }

            auto writeResult = overwriteInPlace( updated );
            if ( !writeResult.HasValue() ) {
                return result::FromError( writeResult.Error() );
            }

            LAP_TKS_LOG_INFO << "Added salt to store file: " << m_strFile;
            return result::FromValue( updated[ LAP_TKS_SALT_FIELD ].get< ::std::string >() );
        }

        case DocumentShape::kUnrecognized:
        default:
            LAP_TKS_LOG_WARN << "Store file has unrecognized shape (" << shapeToString( document.shape ) << "): " << m_strFile;
            return result::FromError( TksErrc::kFormatMismatch );
        }
    }

    core::Result< core::String > CStoreBootstrap::generateSalt() const noexcept
    {
        using result = core::Result< core::String >;

        try {
            core::String salt = m_saltGenerator();
            if ( salt.empty() ) {
                LAP_TKS_LOG_ERROR << "Salt generator returned an empty salt for " << m_strFile;
                return result::FromError( TksErrc::kInvalidArgument );
            }
            return result::FromValue( salt );
        } catch ( const ::std::exception& e ) {
            LAP_TKS_LOG_ERROR.logFormat( "Salt generator failed with exception: %s", e.what() );
        } catch ( ... ) {
            LAP_TKS_LOG_ERROR << "Salt generator failed with unknown exception";
        }

        return result::FromError( TksErrc::kOperationFailed );
    }

    core::Result<void> CStoreBootstrap::overwriteInPlace( const nlohmann::json& root ) noexcept
    {
        using result = core::Result<void>;

        auto content = CStoreDocument::Dump( root, m_indent );
        if ( !content.HasValue() ) {
            return result::FromError( content.Error() );
        }

        // one-time startup path, direct overwrite is sufficient
        const auto& text = content.Value();
        if ( !core::File::Util::WriteBinary( m_strFile,
                                             reinterpret_cast< const core::UInt8* >( text.data() ),
                                             text.size(),
                                             true ) ) {
            LAP_TKS_LOG_ERROR << "Failed to rewrite store file: " << m_strFile;
            return result::FromError( TksErrc::kPhysicalStorageFailure );
        }

        return result::FromValue();
    }
} // namespace tks
} // namespace lap
