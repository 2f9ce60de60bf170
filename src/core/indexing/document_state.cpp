#include "core/indexing/document_state.h"

namespace dq {

namespace {

struct Transition {
    DocumentStatus from;
    DocumentEvent event;
    DocumentStatus to;
};

constexpr Transition kTransitions[] = {
    {DocumentStatus::Processing,    DocumentEvent::ChunksPersisted,  DocumentStatus::ChunksCreated},
    {DocumentStatus::ChunksCreated, DocumentEvent::EmbeddingsStored, DocumentStatus::Completed},
    {DocumentStatus::Processing,    DocumentEvent::Failed,           DocumentStatus::Failed},
    {DocumentStatus::ChunksCreated, DocumentEvent::Failed,           DocumentStatus::Failed},
    {DocumentStatus::Completed,     DocumentEvent::Failed,           DocumentStatus::Failed},
    {DocumentStatus::Failed,        DocumentEvent::Failed,           DocumentStatus::Failed},
    {DocumentStatus::Failed,        DocumentEvent::Resume,           DocumentStatus::Processing},
};

} // namespace

QString documentEventToString(DocumentEvent event)
{
    switch (event) {
    case DocumentEvent::ChunksPersisted:  return QStringLiteral("chunks_persisted");
    case DocumentEvent::EmbeddingsStored: return QStringLiteral("embeddings_stored");
    case DocumentEvent::Failed:           return QStringLiteral("failed");
    case DocumentEvent::Resume:           return QStringLiteral("resume");
    }
    return QStringLiteral("unknown");
}

std::optional<DocumentStatus> nextDocumentStatus(DocumentStatus current, DocumentEvent event)
{
    for (const Transition& transition : kTransitions) {
        if (transition.from == current && transition.event == event) {
            return transition.to;
        }
    }
    return std::nullopt;
}

bool isAllowedTransition(DocumentStatus from, DocumentStatus to)
{
    for (const Transition& transition : kTransitions) {
        if (transition.from == from && transition.to == to) {
            return true;
        }
    }
    return false;
}

} // namespace dq
