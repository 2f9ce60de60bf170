#include "core/shared/error.h"

namespace dq {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Validation:          return QStringLiteral("validation");
    case ErrorKind::UpstreamUnavailable: return QStringLiteral("upstream_unavailable");
    case ErrorKind::NotFound:            return QStringLiteral("not_found");
    case ErrorKind::ConstraintViolation: return QStringLiteral("constraint_violation");
    case ErrorKind::Cancelled:           return QStringLiteral("cancelled");
    case ErrorKind::Storage:             return QStringLiteral("storage");
    }
    return QStringLiteral("storage");
}

QString Error::describe() const
{
    if (message.isEmpty()) {
        return errorKindToString(kind);
    }
    return errorKindToString(kind) + QStringLiteral(": ") + message;
}

} // namespace dq
