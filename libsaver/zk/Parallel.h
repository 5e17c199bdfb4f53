#ifndef SAVER_ZK_PARALLEL_H_
#define SAVER_ZK_PARALLEL_H_

#include <emp-tool/utils/ThreadPool.h>
#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <vector>

namespace saver {

/**
 * Runs f(0) .. f(n-1), split into contiguous blocks on `pool`, or inline
 * when no pool is given. Must not be called from a task already running on
 * the same pool. Waits for every block before rethrowing the first error.
 */
template<typename F>
void parallel_for(emp::ThreadPool* pool, size_t n, F f){
    if (pool == nullptr || n < 2){
        for (size_t i = 0; i < n; i++){
            f(i);
        }
        return;
    }
    size_t blocks = std::thread::hardware_concurrency();
    if (blocks == 0){
        blocks = 4;
    }
    blocks = std::min(blocks, n);
    size_t step = (n + blocks - 1) / blocks;

    std::vector<std::future<void>> futures;
    for (size_t start = 0; start < n; start += step){
        size_t end = std::min(n, start + step);
        futures.emplace_back(pool->enqueue([&f, start, end]() -> void {
            for (size_t i = start; i < end; i++){
                f(i);
            }
        }));
    }
    std::exception_ptr err;
    for (auto& fut : futures){
        try {
            fut.get();
        } catch (...) {
            if (!err){
                err = std::current_exception();
            }
        }
    }
    if (err){
        std::rethrow_exception(err);
    }
}

}

#endif
