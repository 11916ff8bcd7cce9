#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cancel_token.h"
#include "core_status.h"
#include "../client/data_access.h"

namespace keyscope {

// Drives the store's hint-only SCAN until at least `min_count` keys have been
// collected or the enumeration completes (cursor 0).
//
// Keys are appended in arrival order without deduplication; the cache dedups.
// On any failure, including cancellation, `out` is left untouched so a
// partially collected page can never reach the cache.
class cursor_paginator
{
public:
    // Lower bound on the per-call COUNT hint, so small remainders do not spin
    static constexpr size_t DEFAULT_FLOOR_COUNT = 10;

    explicit cursor_paginator(data_access& store, size_t floor_count = DEFAULT_FLOOR_COUNT)
        : m_store(store), m_floor(floor_count ? floor_count : 1) {}

    core_status fetch(uint64_t cursor, std::string_view pattern, size_t min_count,
                      scan_page& out, const cancel_token& cancel = {});

    // Round trips issued by the last fetch()
    size_t last_round_trips() const { return m_round_trips; }

private:
    data_access& m_store;
    size_t m_floor;
    size_t m_round_trips{0};
};

} // namespace keyscope
