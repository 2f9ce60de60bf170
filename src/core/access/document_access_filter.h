#pragma once

#include "core/access/access_filter.h"

namespace dq {

class SQLiteStore;

// Completed documents whose visibility set contains the role.
class DocumentAccessFilter : public AccessFilter {
public:
    explicit DocumentAccessFilter(SQLiteStore& store);

    std::vector<int64_t> documentIdsFor(RoleTag role) override;

private:
    SQLiteStore& m_store;
};

} // namespace dq
