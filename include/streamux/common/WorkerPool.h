#pragma once

#include "streamux/common/noncopyable.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace streamux {
namespace common {

// Fixed set of threads draining an unbounded FIFO of tasks. Request handlers
// run here so that blocking work (disk reads, upstream round trips) never
// stalls an I/O loop.
class WorkerPool : noncopyable {
public:
    using Task = std::function<void()>;

    WorkerPool(const std::string& name, int numThreads);
    ~WorkerPool();

    void Start();
    // Runs every task already queued, then joins the threads.
    void Stop();

    // Returns false once Stop() has been called.
    bool Submit(Task task);

    size_t QueueSize() const;
    int threadNum() const { return numThreads_; }
    const std::string& name() const { return name_; }

private:
    void ThreadFunc(int index);

    const std::string name_;
    const int numThreads_;
    bool running_;
    bool started_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Task> tasks_;
    std::vector<std::thread> threads_;
};

} // namespace common
} // namespace streamux
