// === Stream Event Bus ========================================================
//
// Provides a minimal thread-safe queue for carrying status, error and frame
// notifications from the producer loop to the thread that renders them.

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

namespace ipcam_player {

inline constexpr std::string_view k_status_starting{"Starting streaming"};
inline constexpr std::string_view k_status_started{"Streaming started"};
inline constexpr std::string_view k_status_paused{"Streaming paused"};
inline constexpr std::string_view k_status_playing{"Streaming playing"};
inline constexpr std::string_view k_status_stopping{"Stopping streaming"};
inline constexpr std::string_view k_status_stopped{"Streaming has stopped"};

inline constexpr std::string_view k_error_open_failed{"Failed to open camera stream"};
inline constexpr std::string_view k_error_open_timed_out{"Failed to open camera stream: Operation timed out."};
inline constexpr std::string_view k_error_read_failed{"Error reading frame. Stopping the video stream."};

/** @brief Kind of notification carried by a StreamEvent. */
enum class StreamEventType {
    FrameReady,      /**< A new frame was placed in the FrameBuffer. */
    FirstFrameReady, /**< First frame of the current Start cycle. */
    Status,          /**< Lifecycle status message. */
    Error            /**< Session-terminating error message. */
};

/** @brief Classification of session-terminating errors. */
enum class StreamErrorKind {
    None,
    ConnectTimeout, /**< Open attempt exceeded the timeout window. */
    ConnectFailure, /**< Open attempt returned without an opened handle. */
    ReadFailure     /**< An open source stopped yielding frames. */
};

/** @brief Single notification published by a StreamSession. */
struct StreamEvent final {
    StreamEventType type{StreamEventType::Status};
    std::string message{};
    StreamErrorKind error_kind{StreamErrorKind::None};
    std::uint64_t sequence_number{}; /**< Frame sequence for FrameReady. */
    std::uint64_t generation{};      /**< Start cycle that produced the event. */
};

/** @brief Thread-safe FIFO used to exchange stream events. */
class StreamEventBus final {
  public:
    /**
     * @brief Publish an event to the consumer.
     *
     * A FrameReady event replaces an unconsumed FrameReady at the tail of the
     * queue, mirroring the drop-oldest policy of the FrameBuffer.
     */
    void publish(StreamEvent event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<StreamEvent> try_consume();
    /** @brief Number of events waiting to be consumed. */
    [[nodiscard]] std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::queue<StreamEvent> queue_events_;
};

}  // namespace ipcam_player
