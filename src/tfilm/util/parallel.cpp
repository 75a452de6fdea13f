// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

// util/parallel.cpp*
#include <tfilm/util/parallel.h>

#include <tfilm/util/check.h>
#include <tfilm/util/print.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace tfilm {

std::string AtomicDouble::ToString() const {
    return StringPrintf("%f", double(*this));
}

bool Barrier::Block() {
    std::unique_lock<std::mutex> lock(mutex);

    --numToBlock;
    CHECK_GE(numToBlock, 0);

    if (numToBlock > 0)
        cv.wait(lock, [this]() { return numToBlock == 0; });
    else
        cv.notify_all();

    return --numToExit == 0;
}

// A loop handed to the pool; workers claim chunks of [start, end) until
// none remain. Loops are linked into the pool's list while they have
// unclaimed work.
struct ParallelLoop {
    ParallelLoop(int64_t start, int64_t end, int64_t chunkSize,
                 std::function<void(int64_t, int64_t)> func)
        : func(std::move(func)), nextIndex(start), endIndex(end), chunkSize(chunkSize) {}
    ~ParallelLoop() { DCHECK(!listed); }

    bool HaveWork() const { return nextIndex < endIndex; }
    bool Finished() const { return !HaveWork() && activeWorkers == 0; }

    std::function<void(int64_t, int64_t)> func;
    int64_t nextIndex, endIndex, chunkSize;
    int activeWorkers = 0;
    bool listed = false;
    ParallelLoop *prev = nullptr, *next = nullptr;
};

class ThreadPool {
  public:
    explicit ThreadPool(int nThreads);
    ~ThreadPool();

    size_t size() const { return threads.size(); }

    // Both return with the loop list locked.
    std::unique_lock<std::mutex> Enqueue(ParallelLoop *loop);
    void WorkOrWait(std::unique_lock<std::mutex> *lock);

  private:
    void workerFunc(int tIndex, Barrier *barrier);
    void unlink(ParallelLoop *loop);

    // loops and shutdownThreads are guarded by mutex; cv is signaled when a
    // loop is added or finishes.
    ParallelLoop *loops = nullptr;
    std::mutex mutex;
    std::condition_variable cv;
    bool shutdownThreads = false;

    std::vector<std::thread> threads;
};

thread_local int ThreadIndex;

static std::unique_ptr<ThreadPool> threadPool;

ThreadPool::ThreadPool(int nThreads) {
    ThreadIndex = 0;

    // The calling thread takes part in every loop, so it counts as one of
    // the _nThreads_. The barrier holds the constructor until every worker
    // has its ThreadIndex.
    Barrier *barrier = new Barrier(nThreads);
    for (int i = 1; i < nThreads; ++i)
        threads.push_back(std::thread(&ThreadPool::workerFunc, this, i, barrier));
    if (barrier->Block())
        delete barrier;
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        shutdownThreads = true;
        cv.notify_all();
    }
    for (std::thread &thread : threads)
        thread.join();
}

std::unique_lock<std::mutex> ThreadPool::Enqueue(ParallelLoop *loop) {
    std::unique_lock<std::mutex> lock(mutex);
    loop->next = loops;
    if (loops)
        loops->prev = loop;
    loops = loop;
    loop->listed = true;
    cv.notify_all();
    return lock;
}

void ThreadPool::unlink(ParallelLoop *loop) {
    DCHECK(loop->listed);
    if (loop->prev)
        loop->prev->next = loop->next;
    else
        loops = loop->next;
    if (loop->next)
        loop->next->prev = loop->prev;
    loop->listed = false;
}

void ThreadPool::workerFunc(int tIndex, Barrier *barrier) {
    LOG_VERBOSE("Started worker thread %d", tIndex);
    ThreadIndex = tIndex;
    if (barrier->Block())
        delete barrier;

    std::unique_lock<std::mutex> lock(mutex);
    while (!shutdownThreads)
        WorkOrWait(&lock);
    LOG_VERBOSE("Exiting worker thread %d", tIndex);
}

void ThreadPool::WorkOrWait(std::unique_lock<std::mutex> *lock) {
    DCHECK(lock->owns_lock());
    ParallelLoop *loop = loops;
    if (!loop) {
        cv.wait(*lock);
        return;
    }

    // Claim the next chunk; the last claim takes the loop off the list.
    int64_t start = loop->nextIndex;
    int64_t end = std::min(start + loop->chunkSize, loop->endIndex);
    loop->nextIndex = end;
    if (!loop->HaveWork())
        unlink(loop);
    ++loop->activeWorkers;

    lock->unlock();
    loop->func(start, end);
    lock->lock();

    if (--loop->activeWorkers == 0 && !loop->HaveWork())
        cv.notify_all();
}

void ParallelFor(int64_t start, int64_t end, std::function<void(int64_t, int64_t)> func) {
    CHECK(threadPool);
    if (start >= end)
        return;

    int64_t chunkSize = std::max<int64_t>(1, (end - start) / (8 * RunningThreads()));
    if (end - start <= chunkSize) {
        func(start, end);
        return;
    }

    ParallelLoop loop(start, end, chunkSize, std::move(func));
    std::unique_lock<std::mutex> lock = threadPool->Enqueue(&loop);
    while (!loop.Finished())
        threadPool->WorkOrWait(&lock);
}

int AvailableCores() {
    return std::max<int>(1, std::thread::hardware_concurrency());
}

int RunningThreads() {
    return threadPool ? int(1 + threadPool->size()) : 1;
}

void ParallelInit(int nThreads) {
    CHECK(!threadPool);
    if (nThreads <= 0)
        nThreads = AvailableCores();
    threadPool = std::make_unique<ThreadPool>(nThreads);
}

void ParallelCleanup() {
    threadPool.reset();
}

}  // namespace tfilm
