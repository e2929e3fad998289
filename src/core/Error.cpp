#include "dayplan/core/Error.hpp"

namespace dayplan {
namespace core {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidRange:
        return QStringLiteral("InvalidRange");
    case ErrorCode::NotFound:
        return QStringLiteral("NotFound");
    case ErrorCode::DuplicateId:
        return QStringLiteral("DuplicateId");
    case ErrorCode::NothingToUndo:
        return QStringLiteral("NothingToUndo");
    case ErrorCode::NothingToRedo:
        return QStringLiteral("NothingToRedo");
    case ErrorCode::PersistenceWriteFailed:
        return QStringLiteral("PersistenceWriteFailed");
    case ErrorCode::ParseFailed:
        return QStringLiteral("ParseFailed");
    case ErrorCode::ClockAnomaly:
        return QStringLiteral("ClockAnomaly");
    }
    return QStringLiteral("Unknown");
}

Error Error::invalidRange(const QString &message)
{
    return Error{ ErrorCode::InvalidRange, message, QString(), QString() };
}

Error Error::notFound(const QString &message)
{
    return Error{ ErrorCode::NotFound, message, QString(), QString() };
}

Error Error::duplicateId(const QString &message)
{
    return Error{ ErrorCode::DuplicateId, message, QString(), QString() };
}

Error Error::nothingToUndo()
{
    return Error{ ErrorCode::NothingToUndo, QStringLiteral("Undo stack is empty"), QString(), QString() };
}

Error Error::nothingToRedo()
{
    return Error{ ErrorCode::NothingToRedo, QStringLiteral("Redo stack is empty"), QString(), QString() };
}

Error Error::persistenceWriteFailed(const QString &path, const QString &cause)
{
    return Error{ ErrorCode::PersistenceWriteFailed,
                  QStringLiteral("Failed to write %1").arg(path),
                  path,
                  cause };
}

Error Error::parseFailed(const QString &path, const QString &cause)
{
    return Error{ ErrorCode::ParseFailed,
                  QStringLiteral("Failed to parse %1").arg(path.isEmpty() ? QStringLiteral("calendar data") : path),
                  path,
                  cause };
}

Error Error::clockAnomaly(const QString &message)
{
    return Error{ ErrorCode::ClockAnomaly, message, QString(), QString() };
}

bool Error::isPersistenceFailure() const
{
    return code == ErrorCode::PersistenceWriteFailed;
}

QString Error::toString() const
{
    QString text = QStringLiteral("%1: %2").arg(errorCodeName(code), message);
    if (!cause.isEmpty()) {
        text += QStringLiteral(" (%1)").arg(cause);
    }
    return text;
}

} // namespace core
} // namespace dayplan
