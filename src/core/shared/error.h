#pragma once

#include <QString>

namespace dq {

enum class ErrorKind {
    Validation,           // caller input rejected, nothing persisted
    UpstreamUnavailable,  // embedding / generation / extraction collaborator failed
    NotFound,
    ConstraintViolation,  // uniqueness or foreign key conflict not absorbed by an upsert
    Cancelled,            // deadline expired or caller cancelled
    Storage,              // SQLite or vector index failure
};

QString errorKindToString(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Storage;
    QString message;

    static Error validation(const QString& message) { return {ErrorKind::Validation, message}; }
    static Error upstream(const QString& message) { return {ErrorKind::UpstreamUnavailable, message}; }
    static Error notFound(const QString& message) { return {ErrorKind::NotFound, message}; }
    static Error cancelled(const QString& message) { return {ErrorKind::Cancelled, message}; }
    static Error storage(const QString& message) { return {ErrorKind::Storage, message}; }

    // "kind: message", used for document error_message and CLI output.
    QString describe() const;
};

} // namespace dq
