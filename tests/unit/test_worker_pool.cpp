#include "streamux/common/WorkerPool.h"
#include "streamux/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

using namespace streamux::common;

void testRunsEveryTask() {
    WorkerPool pool("test", 4);
    pool.Start();
    assert(pool.threadNum() == 4);

    std::atomic<int> sum{0};
    for (int i = 1; i <= 1000; ++i) {
        assert(pool.Submit([&sum, i] { sum += i; }));
    }
    pool.Stop();
    assert(sum == 500500);
    assert(pool.QueueSize() == 0);
    assert(!pool.Submit([] {}));
    LOG_INFO << "testRunsEveryTask PASS";
}

void testTasksRunInParallel() {
    WorkerPool pool("parallel", 4);
    pool.Start();

    std::mutex mutex;
    std::set<std::thread::id> ids;
    std::atomic<int> arrived{0};
    for (int i = 0; i < 4; ++i) {
        pool.Submit([&] {
            {
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(std::this_thread::get_id());
            }
            ++arrived;
            // Hold the thread until every task has started somewhere.
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (arrived < 4 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }
    pool.Stop();
    assert(arrived == 4);
    assert(ids.size() == 4);
    LOG_INFO << "testTasksRunInParallel PASS";
}

void testSubmitBeforeStart() {
    WorkerPool pool("idle", 0);
    assert(pool.threadNum() == 1);
    assert(!pool.Submit([] {}));
    pool.Start();
    std::atomic<bool> ran{false};
    assert(pool.Submit([&ran] { ran = true; }));
    pool.Stop();
    assert(ran);
    LOG_INFO << "testSubmitBeforeStart PASS";
}

int main() {
    testRunsEveryTask();
    testTasksRunInParallel();
    testSubmitBeforeStart();
    LOG_INFO << "All WorkerPool tests passed";
    return 0;
}
