#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace toolhost {

// ---------------------------------------------------------------------------
// WorkerPool: fixed set of threads draining a FIFO task queue.
//
// Shutdown() stops intake, lets the workers finish everything already
// queued, then joins them. The destructor calls Shutdown().
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // Returns false once Shutdown() has started; the task is not run.
    bool Submit(std::function<void()> task);

    void Shutdown();

    [[nodiscard]] std::size_t Size() const noexcept { return workers_.size(); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace toolhost
