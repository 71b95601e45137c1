#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace xorblur {

struct ChunkRange {
    size_t begin;
    size_t end;

    size_t size() const { return end - begin; }
};

// Leaves never overlap. Range functions must not throw.
class ParallelChunkExecutor {
public:
    using RangeFn = std::function<void(size_t begin, size_t end)>;

    explicit ParallelChunkExecutor(size_t threshold, int numThreads = 0);

    void run(size_t size, const RangeFn& fn) const;

    // Leaf ranges run() would hand out, in position order.
    std::vector<ChunkRange> plan(size_t size) const;

    size_t getThreshold() const { return threshold_; }

    void setNumThreads(int threads) { numThreads_ = threads; }
    int getNumThreads() const { return numThreads_; }

    static bool isParallelAvailable();
    static int maxThreads();

private:
    void split(size_t begin, size_t end, const RangeFn* fn) const;
    void collect(size_t begin, size_t end, std::vector<ChunkRange>& out) const;

    size_t threshold_;
    int numThreads_;
};

}
