// Scripted VideoSource implementations used to drive StreamSession without a
// camera.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "ipcam_player/stream_event_bus.hpp"
#include "ipcam_player/video_source.hpp"

namespace ipcam_player::test {

/** @brief Observations shared between a test and the sources it hands out. */
struct SourceTally final {
    std::atomic<int> open_calls{0};
    std::atomic<int> reads{0};
    std::atomic<int> blocked_reads{0};
    std::atomic<int> releases{0};
    std::atomic<bool> released{false};
    std::string last_uri;
    std::mutex uri_mutex;
};

/** @brief Latch that keeps an opener or a read blocked until the test lets it go. */
class OpenGate final {
  public:
    void wait() {
        std::unique_lock lock(mutex_);
        condition_.wait(lock, [this]() { return open_; });
    }

    void release() {
        {
            std::scoped_lock lock(mutex_);
            open_ = true;
        }
        condition_.notify_all();
    }

  private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool open_{false};
};

struct ScriptedSourceOptions final {
    bool opened{true};
    Resolution native{1920, 1080};
    int frames_before_failure{-1}; /**< Negative means never fail. */
    std::chrono::milliseconds read_delay{2};
    std::shared_ptr<OpenGate> read_gate{}; /**< When set, every read waits for the gate. */
};

class ScriptedVideoSource final : public VideoSource {
  public:
    ScriptedVideoSource(ScriptedSourceOptions options, std::shared_ptr<SourceTally> tally)
        : options_(options), tally_(std::move(tally)) {}

    ~ScriptedVideoSource() override { release(); }

    bool is_opened() const override { return options_.opened && !released_; }

    Resolution native_resolution() const override { return options_.native; }

    bool read(cv::Mat& frame) override {
        if (options_.read_gate != nullptr) {
            tally_->blocked_reads.fetch_add(1);
            options_.read_gate->wait();
        }
        std::this_thread::sleep_for(options_.read_delay);
        const int index = tally_->reads.fetch_add(1);
        if (options_.frames_before_failure >= 0 && index >= options_.frames_before_failure) {
            return false;
        }
        frame = cv::Mat(options_.native.height_px, options_.native.width_px, CV_8UC3, cv::Scalar(index % 255, 64, 128));
        return true;
    }

    void release() override {
        if (released_) {
            return;
        }
        released_ = true;
        tally_->releases.fetch_add(1);
        tally_->released.store(true);
    }

  private:
    ScriptedSourceOptions options_;
    std::shared_ptr<SourceTally> tally_;
    bool released_{false};
};

/** @brief Opener returning a ScriptedVideoSource immediately. */
inline SourceOpener make_scripted_opener(ScriptedSourceOptions options, std::shared_ptr<SourceTally> tally) {
    return [options, tally](const std::string& uri) -> VideoSourcePtr {
        tally->open_calls.fetch_add(1);
        {
            std::scoped_lock lock(tally->uri_mutex);
            tally->last_uri = uri;
        }
        return std::make_unique<ScriptedVideoSource>(options, tally);
    };
}

/** @brief Opener that blocks on `gate` before returning an opened source. */
inline SourceOpener make_blocking_opener(std::shared_ptr<OpenGate> gate, std::shared_ptr<SourceTally> tally) {
    return [gate, tally](const std::string&) -> VideoSourcePtr {
        tally->open_calls.fetch_add(1);
        gate->wait();
        return std::make_unique<ScriptedVideoSource>(ScriptedSourceOptions{}, tally);
    };
}

/** @brief Poll `predicate` until it holds or `timeout` elapses. */
inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds{3000}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return predicate();
}

/** @brief Accumulates events drained from a bus. */
class EventRecorder final {
  public:
    explicit EventRecorder(std::shared_ptr<StreamEventBus> bus) : bus_(std::move(bus)) {}

    const std::vector<StreamEvent>& drain() {
        while (auto event = bus_->try_consume()) {
            events_.push_back(std::move(*event));
        }
        return events_;
    }

    int count(StreamEventType type) {
        drain();
        int total = 0;
        for (const StreamEvent& event : events_) {
            total += event.type == type ? 1 : 0;
        }
        return total;
    }

    int count(StreamEventType type, std::string_view message) {
        drain();
        int total = 0;
        for (const StreamEvent& event : events_) {
            total += (event.type == type && event.message == message) ? 1 : 0;
        }
        return total;
    }

    std::vector<std::string> statuses() {
        drain();
        std::vector<std::string> messages;
        for (const StreamEvent& event : events_) {
            if (event.type == StreamEventType::Status) {
                messages.push_back(event.message);
            }
        }
        return messages;
    }

    void clear() {
        drain();
        events_.clear();
    }

  private:
    std::shared_ptr<StreamEventBus> bus_;
    std::vector<StreamEvent> events_;
};

}  // namespace ipcam_player::test
