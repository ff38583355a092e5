#pragma once

#include "core/types.hpp"
#include "nav/guidance.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace wg::service {

/// Fire-and-forget front for a (possibly slow) voice backend. speak()
/// enqueues and returns; a worker thread renders messages in order.
class SpeechQueue : public nav::VoiceOutput {
public:
    explicit SpeechQueue(nav::VoiceOutput& backend);
    ~SpeechQueue() override;

    SpeechQueue(const SpeechQueue&) = delete;
    SpeechQueue& operator=(const SpeechQueue&) = delete;

    void speak(const std::string& text) override;

    void start();

    /// Render whatever is still queued, then join the worker.
    void stop();

    u64 spoken_count() const;

private:
    void run();

    nav::VoiceOutput& backend_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> pending_;
    std::thread worker_;
    bool running_ = false;
    bool stopping_ = false;
    u64 spoken_ = 0;
};

} // namespace wg::service
