#pragma once

#include <QString>

namespace dayplan {
namespace core {

enum class ErrorCode
{
    InvalidRange,
    NotFound,
    DuplicateId,
    NothingToUndo,
    NothingToRedo,
    PersistenceWriteFailed,
    ParseFailed,
    ClockAnomaly,
};

QString errorCodeName(ErrorCode code);

struct Error
{
    ErrorCode code = ErrorCode::NotFound;
    QString message;
    // Set for file related failures.
    QString path;
    // Underlying cause as reported by Qt (QSaveFile, QSqlError, ...).
    QString cause;

    static Error invalidRange(const QString &message);
    static Error notFound(const QString &message);
    static Error duplicateId(const QString &message);
    static Error nothingToUndo();
    static Error nothingToRedo();
    static Error persistenceWriteFailed(const QString &path, const QString &cause);
    static Error parseFailed(const QString &path, const QString &cause);
    static Error clockAnomaly(const QString &message);

    bool isPersistenceFailure() const;
    QString toString() const;
};

} // namespace core
} // namespace dayplan
