#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <iterator>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "CharacterRecognizer.hpp"
#include "utils/Logger.hpp"

namespace kc {

enum class ReplyStatus { Ok, NothingToRecognize, Failed };

struct RecognitionReply {
    uint64_t sequence{0};
    ReplyStatus status{ReplyStatus::Ok};
    std::vector<RecognitionResult> results;
    std::string error;
};

// Runs recognition requests off the calling thread. Requests are numbered in
// submission order; a reply older than one already delivered is dropped, so
// callbacks only ever see newer results. Callbacks run one at a time on a
// worker thread and must not call waitForIdle().
class RecognitionDispatcher {
public:
    using Callback = std::function<void(const RecognitionReply &)>;

    explicit RecognitionDispatcher(std::shared_ptr<const CharacterRecognizer> recognizer)
        : m_recognizer(std::move(recognizer)) {}

    ~RecognitionDispatcher() {
        try {
            waitForIdle();
        } catch (const std::exception &err) {
            KC_LOG(LogLevel::Error, std::string("Recognition callback failed: ") + err.what());
        }
    }

    RecognitionDispatcher(const RecognitionDispatcher &) = delete;
    RecognitionDispatcher &operator=(const RecognitionDispatcher &) = delete;

    // Exceptions escaping an earlier callback are rethrown here or from
    // waitForIdle().
    uint64_t submit(Session session, Callback callback) {
        std::vector<std::future<void>> finished;
        uint64_t seq = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            finished = takeFinished();
            seq = ++m_lastSubmitted;
            m_pending.push_back(std::async(std::launch::async,
                                           [this, seq, s = std::move(session),
                                            cb = std::move(callback)]() {
                                               deliver(process(seq, s), cb);
                                           }));
        }
        for (auto &f : finished)
            f.get();
        return seq;
    }

    void waitForIdle() {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pending.swap(m_pending);
        }
        for (auto &f : pending)
            f.get();
    }

    uint64_t lastSubmitted() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastSubmitted;
    }

    uint64_t lastDelivered() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastDelivered;
    }

private:
    RecognitionReply process(uint64_t seq, const Session &session) const {
        RecognitionReply reply;
        reply.sequence = seq;
        if (session.empty()) {
            reply.status = ReplyStatus::NothingToRecognize;
            return reply;
        }
        try {
            reply.results = m_recognizer->recognize(session);
        } catch (const RecognitionError &err) {
            reply.status = ReplyStatus::Failed;
            reply.error = err.what();
            KC_LOG(LogLevel::Error, "Recognition #" + std::to_string(seq) + " failed: " + err.what());
        }
        return reply;
    }

    // The staleness check and the callback run under m_deliveryMutex so that
    // replies reach the callback in increasing sequence order.
    void deliver(const RecognitionReply &reply, const Callback &callback) {
        std::lock_guard<std::mutex> delivery(m_deliveryMutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (reply.sequence < m_lastDelivered) {
                KC_LOG(LogLevel::Debug, "Dropping stale reply #" + std::to_string(reply.sequence));
                return;
            }
            m_lastDelivered = reply.sequence;
        }
        if (callback)
            callback(reply);
    }

    // Caller holds m_mutex.
    std::vector<std::future<void>> takeFinished() {
        std::vector<std::future<void>> finished;
        auto it = std::partition(m_pending.begin(), m_pending.end(), [](std::future<void> &f) {
            return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        std::move(it, m_pending.end(), std::back_inserter(finished));
        m_pending.erase(it, m_pending.end());
        return finished;
    }

    std::shared_ptr<const CharacterRecognizer> m_recognizer;
    mutable std::mutex m_mutex;
    std::mutex m_deliveryMutex;
    std::vector<std::future<void>> m_pending;
    uint64_t m_lastSubmitted{0};
    uint64_t m_lastDelivered{0};
};

} // namespace kc
