#pragma once
#include <string>
#include <vector>

#include "core_status.h"
#include "key_type.h"
#include "../client/data_access.h"

namespace keyscope {

// Resolves the type of many keys in one pipelined round trip.
class type_batcher
{
public:
    explicit type_batcher(data_access& store) : m_store(store) {}

    // `keys` should be distinct; duplicates are collapsed before the round trip.
    // Zero keys yields an empty map without touching the store. The batch is
    // all-or-nothing: on failure `out` is not modified.
    core_status resolve_types(const std::vector<std::string>& keys, type_map& out);

    size_t round_trips() const { return m_round_trips; }

private:
    data_access& m_store;
    size_t m_round_trips{0};
};

} // namespace keyscope
