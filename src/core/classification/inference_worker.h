#pragma once

#include "core/shared/types.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace im {

// Serializes jobs onto one worker thread so the non-reentrant inference
// primitive is never entered concurrently. Each caller waits at most
// timeoutMs for its own job; a timeout of 0 runs jobs inline on the caller,
// one caller at a time.
class InferenceWorker {
public:
    using Job = std::function<ScoreMap()>;

    explicit InferenceWorker(int timeoutMs, int queueLimit = kDefaultQueueLimit);
    ~InferenceWorker();

    InferenceWorker(const InferenceWorker&) = delete;
    InferenceWorker& operator=(const InferenceWorker&) = delete;

    // nullopt on timeout, full queue, or a job that threw. A job abandoned by
    // its caller is skipped if it has not started yet.
    std::optional<ScoreMap> run(Job job);

    int timeoutMs() const { return m_timeoutMs; }

    struct Stats {
        int64_t submitted = 0;
        int64_t completed = 0;
        int64_t timedOut = 0;
        int64_t failed = 0;
    };
    Stats stats() const;

    static constexpr int kDefaultQueueLimit = 64;

private:
    struct Task {
        Job job;
        std::promise<std::optional<ScoreMap>> promise;
        std::atomic<bool> abandoned{false};
    };

    std::optional<ScoreMap> execute(Task& task);
    void workerLoop();

    int m_timeoutMs = 0;
    int m_queueLimit = kDefaultQueueLimit;

    std::mutex m_inlineMutex;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::shared_ptr<Task>> m_queue;
    bool m_stop = false;
    std::thread m_thread;

    std::atomic<int64_t> m_submitted{0};
    std::atomic<int64_t> m_completed{0};
    std::atomic<int64_t> m_timedOut{0};
    std::atomic<int64_t> m_failed{0};
};

} // namespace im
