// === Stream Session ==========================================================
//
// Owns the connection lifecycle of one camera stream. A session moves through
// Idle -> Connecting -> Streaming <-> Paused -> Stopping -> Idle, or ends in
// Failed when the camera cannot be opened or stops delivering frames.
//
// The producer loop runs on its own thread and hands frames to the consumer
// through a FrameBuffer, while lifecycle notifications travel through a
// StreamEventBus. The blocking open call runs on a third, detached thread that
// is abandoned once the connect timeout expires. Every Start and Stop bumps a
// generation counter; work belonging to an older generation is discarded, so a
// late open result or a lingering loop can never touch the current session.

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include "ipcam_player/connection_config.hpp"
#include "ipcam_player/frame_buffer.hpp"
#include "ipcam_player/stream_event_bus.hpp"
#include "ipcam_player/types.hpp"
#include "ipcam_player/video_source.hpp"

namespace spdlog {
class logger;
}

namespace ipcam_player {

/** @brief Timing knobs for a StreamSession. */
struct StreamSessionOptions final {
    Duration connect_timeout{Duration{20.0}};                 /**< Bound on the open attempt. */
    Duration stop_timeout{Duration{5.0}};                     /**< Bound on joining the producer loop. */
    std::chrono::milliseconds pause_poll_interval{10};        /**< Sleep between polls while paused. */
    std::chrono::milliseconds connect_poll_interval{50};      /**< Granularity of the connect wait. */
};

/** @brief State machine plus producer loop for a single camera stream. */
class StreamSession final {
  public:
    StreamSession(SourceOpener opener,
                  std::shared_ptr<FrameBuffer> frame_buffer,
                  std::shared_ptr<StreamEventBus> event_bus,
                  StreamSessionOptions options = {});
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /**
     * @brief Begin connecting to the camera described by `config`.
     *
     * Accepted only from Idle or Failed and only when the config has a host.
     * @return true when a new Connecting cycle was started.
     */
    bool start(const ConnectionConfig& config);
    /** @brief Terminate the active session; no-op when nothing is active. */
    void stop();
    /**
     * @brief Pause or resume frame acquisition.
     * @return false when the session is not Streaming or Paused.
     */
    bool pause(bool paused);

    [[nodiscard]] StreamState state() const;
    /** @brief True while Connecting, Streaming, Paused or Stopping. */
    [[nodiscard]] bool is_active() const;
    /** @brief Whether frames are rescaled to the requested resolution. */
    [[nodiscard]] bool resize_needed() const;
    /** @brief Resolution reported by the source at connect time. */
    [[nodiscard]] Resolution native_resolution() const;
    /** @brief Frames published during the current Start cycle. */
    [[nodiscard]] std::uint64_t frames_published() const;
    /** @brief Current generation; increments on every Start and Stop. */
    [[nodiscard]] std::uint64_t generation() const;

    [[nodiscard]] const std::shared_ptr<FrameBuffer>& frame_buffer() const noexcept;
    [[nodiscard]] const std::shared_ptr<StreamEventBus>& event_bus() const noexcept;

    struct Core;

  private:
    /** @brief Join the previous producer thread, detaching it if it overruns the stop timeout. */
    void reap_producer_thread();

    std::shared_ptr<Core> core_;
    std::mutex lifecycle_mutex_;          /**< Serializes start/stop callers. */
    std::thread producer_thread_;
    std::future<void> producer_finished_; /**< Ready once the loop has released its source. */
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ipcam_player
