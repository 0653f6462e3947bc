/**
 * @file CTksErrorDomain.hpp
 * @brief Error domain of the TokenStore module
 * @version 0.1
 * @date 2025-11-20
 *
 *
 */
#ifndef LAP_TOKENSTORE_TKSERRORDOMAIN_HPP
#define LAP_TOKENSTORE_TKSERRORDOMAIN_HPP

#include <exception>
#include <cerrno>
#include <cstring>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>

namespace lap
{
namespace tks
{
    enum class TksErrc : core::ErrorDomain::CodeType
    {
        kStoreNotFound              = 1,
        kNotInitialized             = 2,
        kPhysicalStorageFailure     = 3,
        kIntegrityCorrupted         = 4,
        kFormatMismatch             = 5,
        kFileNotFound               = 6,
        kPermissionDenied           = 7,
        kRenameFailed               = 8,
        kDuplicateKey               = 9,
        kInvalidArgument            = 10,
        kInvalidRecord              = 11,
        kSerializerStopped          = 12,
        kOperationFailed            = 13,
        kUnsupported                = 14
    };

    inline constexpr const core::Char* TksErrMessage( TksErrc errCode )
    {
        auto const code = static_cast< TksErrc >( errCode );

        switch ( code ) {
        case TksErrc::kStoreNotFound:
            return "The requested token store does not exist and creation was not requested.";
        case TksErrc::kNotInitialized:
            return "The token store manager is used before initialize() or after uninitialize().";
        case TksErrc::kPhysicalStorageFailure:
            return "Access to the storage fails.";
        case TksErrc::kIntegrityCorrupted:
            return "Stored data cannot be parsed as JSON.";
        case TksErrc::kFormatMismatch:
            return "Stored data is valid JSON but matches neither the legacy nor the current document shape.";
        case TksErrc::kFileNotFound:
            return "The store file cannot be found.";
        case TksErrc::kPermissionDenied:
            return std::strerror( EACCES );
        case TksErrc::kRenameFailed:
            return "Replacing the store file with the temporary file failed.";
        case TksErrc::kDuplicateKey:
            return "Two records share the same key field value.";
        case TksErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        case TksErrc::kInvalidRecord:
            return "A record is not a JSON object or cannot be serialized.";
        case TksErrc::kSerializerStopped:
            return "The write serializer is stopped and no longer accepts operations.";
        case TksErrc::kOperationFailed:
            return "A queued write operation terminated with an exception.";
        case TksErrc::kUnsupported:
            return "Not support yet.";
        default:
            return "Unknown error";
        }
    }

    class TksException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(TksException)

        explicit TksException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~TksException() noexcept
        {
            ;
        }

        const core::Char* what() const noexcept
        {
            return TksErrMessage( static_cast< TksErrc > ( Error().Value() ) );
        }
    };

    class TksErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(TksErrorDomain)

        using Errc          = TksErrc;
        using Exception     = TksException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "TksErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return TksErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw TksException( errorCode ); }

        constexpr TksErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000201 )
        {
            ;
        }
    };

    static constexpr TksErrorDomain g_tksErrorDomain;

    constexpr const core::ErrorDomain& GetTksDomain () noexcept
    {
        return g_tksErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( TksErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetTksDomain(), data };
    }
} // namespace tks
} // namespace lap

#endif
