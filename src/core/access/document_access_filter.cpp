#include "core/access/document_access_filter.h"
#include "core/index/sqlite_store.h"

namespace dq {

DocumentAccessFilter::DocumentAccessFilter(SQLiteStore& store)
    : m_store(store)
{
}

std::vector<int64_t> DocumentAccessFilter::documentIdsFor(RoleTag role)
{
    return m_store.completedDocumentIdsVisibleTo(role);
}

} // namespace dq
