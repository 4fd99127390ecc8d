#include "core/classification/inference_worker.h"

#include "core/shared/logging.h"

#include <chrono>
#include <exception>

namespace im {

InferenceWorker::InferenceWorker(int timeoutMs, int queueLimit)
    : m_timeoutMs(timeoutMs > 0 ? timeoutMs : 0)
    , m_queueLimit(queueLimit > 0 ? queueLimit : kDefaultQueueLimit)
{
    if (m_timeoutMs > 0) {
        m_thread = std::thread([this]() {
            workerLoop();
        });
    }
}

InferenceWorker::~InferenceWorker()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

std::optional<ScoreMap> InferenceWorker::execute(Task& task)
{
    try {
        std::optional<ScoreMap> result = task.job();
        m_completed.fetch_add(1);
        return result;
    } catch (const std::exception& ex) {
        LOG_WARN(imModel, "InferenceWorker: job failed: %s", ex.what());
        m_failed.fetch_add(1);
        return std::nullopt;
    } catch (...) {
        LOG_WARN(imModel, "InferenceWorker: job failed: unknown exception");
        m_failed.fetch_add(1);
        return std::nullopt;
    }
}

void InferenceWorker::workerLoop()
{
    for (;;) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() {
                return m_stop || !m_queue.empty();
            });
            if (m_stop && m_queue.empty()) {
                return;
            }
            task = m_queue.front();
            m_queue.pop_front();
        }

        if (task->abandoned.load()) {
            task->promise.set_value(std::nullopt);
            continue;
        }
        task->promise.set_value(execute(*task));
    }
}

std::optional<ScoreMap> InferenceWorker::run(Job job)
{
    m_submitted.fetch_add(1);

    if (m_timeoutMs == 0) {
        // Inline callers still take turns on the inference primitive.
        std::lock_guard<std::mutex> lock(m_inlineMutex);
        Task inlineTask;
        inlineTask.job = std::move(job);
        return execute(inlineTask);
    }

    auto task = std::make_shared<Task>();
    task->job = std::move(job);
    std::future<std::optional<ScoreMap>> future = task->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (static_cast<int>(m_queue.size()) >= m_queueLimit) {
            LOG_WARN(imModel, "InferenceWorker: queue full (%d), rejecting job", m_queueLimit);
            m_failed.fetch_add(1);
            return std::nullopt;
        }
        m_queue.push_back(task);
    }
    m_cv.notify_one();

    const auto status = future.wait_for(std::chrono::milliseconds(m_timeoutMs));
    if (status == std::future_status::ready) {
        return future.get();
    }

    task->abandoned.store(true);
    m_timedOut.fetch_add(1);
    LOG_WARN(imModel, "InferenceWorker: job exceeded %d ms, abandoning", m_timeoutMs);
    return std::nullopt;
}

InferenceWorker::Stats InferenceWorker::stats() const
{
    return {m_submitted.load(), m_completed.load(), m_timedOut.load(), m_failed.load()};
}

} // namespace im
