#pragma once
#include <atomic>
#include <cstdint>

namespace keyscope {

// Snapshot of a generation counter. Bumping the counter cancels every token
// taken before the bump; default-constructed tokens never cancel.
struct cancel_token
{
    const std::atomic<uint64_t>* generation{nullptr};
    uint64_t expected{0};

    static cancel_token observe(const std::atomic<uint64_t>& gen)
    {
        return {&gen, gen.load(std::memory_order_acquire)};
    }

    bool cancelled() const
    {
        return generation && generation->load(std::memory_order_acquire) != expected;
    }
};

} // namespace keyscope
