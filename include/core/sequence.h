#pragma once

#include <atomic>
#include <cstdint>

namespace liarslie::core {

// Monotonic allocator for agent ids and ports. Values are never handed out twice.
class SequenceAllocator {
public:
    explicit SequenceAllocator(uint64_t start = 1) : next_(start) {}

    uint64_t next() { return next_.fetch_add(1); }
    uint64_t peek() const { return next_.load(); }

private:
    std::atomic<uint64_t> next_;
};

}
