#pragma once

#include "core/shared/deadline.h"

#include <QString>

#include <vector>

namespace dq {

struct EmbeddingResult {
    enum class Status {
        Success,
        Unavailable,     // provider error, circuit open, bad output
        Cancelled,
    };

    Status status = Status::Unavailable;
    std::vector<float> vector;
    QString errorMessage;

    bool ok() const { return status == Status::Success; }

    static EmbeddingResult success(std::vector<float> vector)
    {
        EmbeddingResult result;
        result.status = Status::Success;
        result.vector = std::move(vector);
        return result;
    }
    static EmbeddingResult failure(Status status, const QString& message)
    {
        EmbeddingResult result;
        result.status = status;
        result.errorMessage = message;
        return result;
    }
};

// EmbeddingProvider: the model behind text -> vector. Implementations must
// be safe to call from several worker threads at once and should return
// Cancelled promptly once the deadline expires.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual EmbeddingResult embed(const QString& text, const Deadline& deadline) = 0;
    virtual int dimensions() const = 0;
    virtual QString modelId() const = 0;
};

} // namespace dq
