#include "chunk_executor.hpp"
#include <stdexcept>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace xorblur {

ParallelChunkExecutor::ParallelChunkExecutor(size_t threshold, int numThreads)
    : threshold_(threshold), numThreads_(numThreads) {
    if (threshold_ == 0) {
        throw std::invalid_argument("Chunk threshold must be positive");
    }
}

bool ParallelChunkExecutor::isParallelAvailable() {
#ifdef HAS_OPENMP
    return true;
#else
    return false;
#endif
}

int ParallelChunkExecutor::maxThreads() {
#ifdef HAS_OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void ParallelChunkExecutor::run(size_t size, const RangeFn& fn) const {
    if (size == 0) {
        return;
    }
    if (size <= threshold_) {
        fn(0, size);
        return;
    }

    const RangeFn* task = &fn;
#ifdef HAS_OPENMP
    int threads = numThreads_ > 0 ? numThreads_ : omp_get_max_threads();

    #pragma omp parallel num_threads(threads)
    {
        #pragma omp single
        split(0, size, task);
    }
#else
    split(0, size, task);
#endif
}

void ParallelChunkExecutor::split(size_t begin, size_t end, const RangeFn* fn) const {
    if (end - begin <= threshold_) {
        (*fn)(begin, end);
        return;
    }

    size_t mid = begin + (end - begin) / 2;

#ifdef HAS_OPENMP
    #pragma omp task firstprivate(begin, mid, fn)
    split(begin, mid, fn);

    #pragma omp task firstprivate(mid, end, fn)
    split(mid, end, fn);

    #pragma omp taskwait
#else
    split(begin, mid, fn);
    split(mid, end, fn);
#endif
}

std::vector<ChunkRange> ParallelChunkExecutor::plan(size_t size) const {
    std::vector<ChunkRange> chunks;
    if (size > 0) {
        collect(0, size, chunks);
    }
    return chunks;
}

void ParallelChunkExecutor::collect(size_t begin, size_t end, std::vector<ChunkRange>& out) const {
    if (end - begin <= threshold_) {
        out.push_back({begin, end});
        return;
    }
    size_t mid = begin + (end - begin) / 2;
    collect(begin, mid, out);
    collect(mid, end, out);
}

}
