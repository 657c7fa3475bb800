#include "streamux/common/WorkerPool.h"
#include "streamux/common/Logger.h"

namespace streamux {
namespace common {

WorkerPool::WorkerPool(const std::string& name, int numThreads)
    : name_(name),
      numThreads_(numThreads > 0 ? numThreads : 1),
      running_(false),
      started_(false) {
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) return;
        started_ = true;
        running_ = true;
    }

    threads_.reserve(numThreads_);
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(&WorkerPool::ThreadFunc, this, i);
    }
    LOG_INFO << "WorkerPool[" << name_ << "] started with " << numThreads_ << " threads";
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cond_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    LOG_INFO << "WorkerPool[" << name_ << "] stopped";
}

bool WorkerPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return false;
        tasks_.push_back(std::move(task));
    }
    cond_.notify_one();
    return true;
}

size_t WorkerPool::QueueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::ThreadFunc(int index) {
    LOG_DEBUG << "WorkerPool[" << name_ << "] thread " << index << " running";
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            // Drain what was accepted before Stop() so no request is lost.
            if (tasks_.empty()) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

} // namespace common
} // namespace streamux
