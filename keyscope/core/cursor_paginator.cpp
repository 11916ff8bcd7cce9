#include "cursor_paginator.h"
#include "../shared/logging.h"

#include <algorithm>

namespace keyscope {

core_status cursor_paginator::fetch(uint64_t cursor, std::string_view pattern, size_t min_count,
                                    scan_page& out, const cancel_token& cancel)
{
    m_round_trips = 0;
    if (min_count == 0)
        min_count = 1;

    scan_page acc;
    acc.cursor = cursor;

    // A single SCAN may legitimately return zero keys with a non-zero cursor,
    // so only the cursor reaching 0 or the count being met ends the loop.
    do
    {
        if (cancel.cancelled())
        {
            LOG_DEBUG("scan cancelled, discarding accumulated keys");
            return core_status::fail(status_cancelled, "scan cancelled");
        }

        size_t want = std::max(min_count - acc.keys.size(), m_floor);

        scan_page batch;
        auto st = m_store.scan(acc.cursor, pattern, want, batch);
        ++m_round_trips;
        if (!st)
            return st;

        LOG_DEBUGF("scan cursor=%llu hint=%zu -> next=%llu keys=%zu",
            static_cast<unsigned long long>(acc.cursor), want,
            static_cast<unsigned long long>(batch.cursor), batch.keys.size());

        acc.cursor = batch.cursor;
        acc.keys.insert(acc.keys.end(),
            std::make_move_iterator(batch.keys.begin()),
            std::make_move_iterator(batch.keys.end()));
    }
    while (acc.keys.size() < min_count && acc.cursor != 0);

    out = std::move(acc);
    return core_status::success();
}

} // namespace keyscope
