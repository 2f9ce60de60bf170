#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>

#include <cstdint>
#include <optional>

namespace dq {

struct Document {
    int64_t id = 0;
    QString filename;
    int64_t sizeBytes = 0;
    QString mediaType;
    QString storagePath;
    DocumentStatus status = DocumentStatus::Processing;
    std::optional<QString> errorMessage;
    VisibilitySet visibleTo;
    QDateTime createdAt;
    QDateTime updatedAt;
};

// Metadata supplied when a file is uploaded, before any processing.
struct UploadRequest {
    QString filename;
    int64_t sizeBytes = 0;
    QString mediaType;
    QString storagePath;
    VisibilitySet visibleTo;
};

struct CustomerQuery {
    int64_t id = 0;
    QString question;
    QString customerName;
    QString customerEmail;
    CustomerQueryStatus status = CustomerQueryStatus::Pending;
    QDateTime createdAt;
};

} // namespace dq
