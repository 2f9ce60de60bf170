#pragma once

#include "core/shared/types.h"

#include <cstdint>
#include <vector>

namespace dq {

// Decides which documents a caller role may retrieve from.
class AccessFilter {
public:
    virtual ~AccessFilter() = default;

    virtual std::vector<int64_t> documentIdsFor(RoleTag role) = 0;
};

} // namespace dq
