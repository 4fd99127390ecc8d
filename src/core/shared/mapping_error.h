#pragma once

#include <QString>

namespace im {

// Reasons a mapping request is rejected before any scoring happens.
enum class MappingErrorCode : int {
    UnknownQuestion   = 1,
    DuplicateResponse = 2,
    EmptySelection    = 3,
    UnknownOption     = 4,
    DuplicateOption   = 5,
    InvalidInput      = 6,
};

struct MappingError {
    MappingErrorCode code = MappingErrorCode::InvalidInput;
    int questionId = 0;
    QString optionId;
    QString message;
};

inline QString mappingErrorCodeToString(MappingErrorCode code)
{
    switch (code) {
    case MappingErrorCode::UnknownQuestion:   return QStringLiteral("UNKNOWN_QUESTION");
    case MappingErrorCode::DuplicateResponse: return QStringLiteral("DUPLICATE_RESPONSE");
    case MappingErrorCode::EmptySelection:    return QStringLiteral("EMPTY_SELECTION");
    case MappingErrorCode::UnknownOption:     return QStringLiteral("UNKNOWN_OPTION");
    case MappingErrorCode::DuplicateOption:   return QStringLiteral("DUPLICATE_OPTION");
    case MappingErrorCode::InvalidInput:      return QStringLiteral("INVALID_INPUT");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace im
