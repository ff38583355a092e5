#include "service/speech_queue.hpp"

#include <spdlog/spdlog.h>

namespace wg::service {

SpeechQueue::SpeechQueue(nav::VoiceOutput& backend) : backend_(backend) {}

SpeechQueue::~SpeechQueue() {
    stop();
}

void SpeechQueue::speak(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(text);
    }
    cv_.notify_one();
}

void SpeechQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    stopping_ = false;
    worker_ = std::thread(&SpeechQueue::run, this);
}

void SpeechQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

u64 SpeechQueue::spoken_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spoken_;
}

void SpeechQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] { return !pending_.empty() || stopping_; });
        if (pending_.empty()) break;

        std::string text = std::move(pending_.front());
        pending_.pop_front();

        lock.unlock();
        backend_.speak(text);
        lock.lock();
        spoken_++;
    }
    spdlog::debug("SpeechQueue: worker stopped after {} messages", spoken_);
}

} // namespace wg::service
