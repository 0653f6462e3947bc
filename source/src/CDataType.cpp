#include "CDataType.hpp"

namespace lap
{
namespace tks
{
    core::String shapeToString( DocumentShape shape ) noexcept
    {
        switch( shape ) {
        case DocumentShape::kLegacySequence:
            return "legacy-sequence";
        case DocumentShape::kDocument:
            return "document";
        case DocumentShape::kDocumentNoRecords:
            return "document-without-records";
        case DocumentShape::kUnrecognized:
            return "unrecognized";
        }

        return "unknown";
    }
} // namespace tks
} // namespace lap
