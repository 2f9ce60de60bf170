#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>

namespace dq {

// Events that drive a document through ingestion.
enum class DocumentEvent {
    ChunksPersisted,    // processing -> chunks_created
    EmbeddingsStored,   // chunks_created -> completed
    Failed,             // any -> failed
    Resume,             // failed -> processing (retry entry)
};

QString documentEventToString(DocumentEvent event);

// Pure transition function over the allowed-transition table.
// Returns nullopt when the event is not allowed in the given state.
std::optional<DocumentStatus> nextDocumentStatus(DocumentStatus current, DocumentEvent event);

// True when moving directly from -> to is in the table.
bool isAllowedTransition(DocumentStatus from, DocumentStatus to);

} // namespace dq
