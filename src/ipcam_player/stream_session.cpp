#include "ipcam_player/stream_session.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <utility>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "ipcam_player/logging.hpp"

namespace ipcam_player {

/**
 * @brief State shared between the session object and its worker threads.
 *
 * Worker threads hold a shared_ptr to the core and never the session itself,
 * which keeps a detached loop or connect attempt safe after the session is gone.
 */
struct StreamSession::Core final {
    SourceOpener opener;
    StreamSessionOptions options;
    std::shared_ptr<FrameBuffer> frame_buffer;
    std::shared_ptr<StreamEventBus> event_bus;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    StreamState state{StreamState::Idle};
    std::uint64_t generation{0};
    bool first_frame_received{false};
    bool resize_needed{false};
    Resolution native_resolution{};
    std::uint64_t frames_published{0};
    std::shared_ptr<std::atomic<std::uint64_t>> generation_token{std::make_shared<std::atomic<std::uint64_t>>(0)};

    /** @brief Caller must hold `mutex`. */
    [[nodiscard]] bool is_current_locked(std::uint64_t cycle) const {
        return generation == cycle;
    }

    [[nodiscard]] bool is_current(std::uint64_t cycle) const {
        std::scoped_lock lock(mutex);
        return is_current_locked(cycle);
    }

    /** @brief Caller must hold `mutex`. */
    void bump_generation_locked() {
        ++generation;
        generation_token->store(generation);
    }

    /** @brief Publish an event only if `cycle` is still the live generation. */
    bool emit_if_current(std::uint64_t cycle, StreamEvent event) {
        std::scoped_lock lock(mutex);
        if (!is_current_locked(cycle)) {
            return false;
        }
        event.generation = cycle;
        event_bus->publish(std::move(event));
        return true;
    }

    void emit_status(std::uint64_t cycle, std::string_view message) {
        StreamEvent event{};
        event.type = StreamEventType::Status;
        event.message = std::string{message};
        if (emit_if_current(cycle, std::move(event))) {
            logger->info("Stream status: {}", message);
        }
    }

    /**
     * @brief Move the session to Failed and report the error.
     * @return false when the cycle was already superseded.
     */
    bool fail(std::uint64_t cycle, StreamErrorKind kind, std::string_view message) {
        {
            std::scoped_lock lock(mutex);
            if (!is_current_locked(cycle)) {
                return false;
            }
            state = StreamState::Failed;
            StreamEvent error_event{};
            error_event.type = StreamEventType::Error;
            error_event.message = std::string{message};
            error_event.error_kind = kind;
            error_event.generation = cycle;
            event_bus->publish(std::move(error_event));
        }
        logger->error("Stream error: {}", message);
        emit_status(cycle, k_status_stopping);
        return true;
    }
};

namespace {

enum class ConnectOutcome {
    Connected,
    TimedOut,
    OpenFailed,
    Abandoned
};

using SessionCore = StreamSession::Core;

/**
 * @brief Run the opener on a detached thread and wait for it with a bound.
 *
 * The wait is sliced so that a Stop issued while connecting is noticed quickly.
 */
ConnectOutcome connect_source(const std::shared_ptr<SessionCore>& core,
                              std::uint64_t cycle,
                              const std::string& uri,
                              VideoSourcePtr& source_out) {
    auto promise_source = std::make_shared<std::promise<VideoSourcePtr>>();
    auto flag_abandoned = std::make_shared<std::atomic<bool>>(false);
    std::future<VideoSourcePtr> future_source = promise_source->get_future();

    std::thread(
        [opener = core->opener, uri, cycle, promise_source, flag_abandoned, token = core->generation_token]() {
            VideoSourcePtr source;
            try {
                source = opener(uri);
            } catch (...) {
                promise_source->set_exception(std::current_exception());
                return;
            }
            if (source != nullptr && (flag_abandoned->load() || token->load() != cycle)) {
                get_logger()->info("Discarding camera handle from an abandoned connect attempt");
                source->release();
                source.reset();
            }
            promise_source->set_value(std::move(source));
        }
    ).detach();

    const auto deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(core->options.connect_timeout);
    while (true) {
        const auto now = SteadyClock::now();
        if (now >= deadline) {
            flag_abandoned->store(true);
            return ConnectOutcome::TimedOut;
        }
        const auto slice = std::min<SteadyClock::duration>(deadline - now, core->options.connect_poll_interval);
        if (future_source.wait_for(slice) == std::future_status::ready) {
            break;
        }
        {
            std::scoped_lock lock(core->mutex);
            if (!core->is_current_locked(cycle) || core->state != StreamState::Connecting) {
                flag_abandoned->store(true);
                return ConnectOutcome::Abandoned;
            }
        }
    }

    try {
        source_out = future_source.get();
    } catch (const std::exception& exc) {
        core->logger->error("Camera open attempt threw: {}", exc.what());
        return ConnectOutcome::OpenFailed;
    }
    if (source_out == nullptr || !source_out->is_opened()) {
        if (source_out != nullptr) {
            source_out->release();
            source_out.reset();
        }
        return ConnectOutcome::OpenFailed;
    }
    return ConnectOutcome::Connected;
}

/** @brief Record native resolution and switch Connecting -> Streaming. */
bool enter_streaming(const std::shared_ptr<SessionCore>& core,
                     std::uint64_t cycle,
                     const ConnectionConfig& config,
                     const VideoSource& source) {
    const Resolution native = source.native_resolution();
    bool resize_needed = false;
    {
        std::scoped_lock lock(core->mutex);
        if (!core->is_current_locked(cycle) || core->state != StreamState::Connecting) {
            return false;
        }
        core->native_resolution = native;
        core->resize_needed = native != config.requested_resolution;
        core->state = StreamState::Streaming;
        resize_needed = core->resize_needed;
    }
    core->logger->info(
        "Connected to {} (native {}, requested {}, resize={})",
        masked_uri(config),
        to_string(native),
        to_string(config.requested_resolution),
        resize_needed
    );
    return true;
}

/** @brief Publish one frame and the matching notifications for `cycle`. */
bool publish_frame(const std::shared_ptr<SessionCore>& core, std::uint64_t cycle, cv::Mat image) {
    auto frame = std::make_shared<CameraFrame>();
    frame->width_px = image.cols;
    frame->height_px = image.rows;
    frame->channel_order = ChannelOrder::Bgr;
    frame->captured_at = SteadyClock::now();
    frame->image = std::move(image);

    bool first_frame = false;
    {
        std::scoped_lock lock(core->mutex);
        if (!core->is_current_locked(cycle)) {
            return false;
        }
        frame->sequence_number = ++core->frames_published;
        const std::uint64_t sequence = frame->sequence_number;
        core->frame_buffer->publish(std::move(frame));

        StreamEvent frame_event{};
        frame_event.type = StreamEventType::FrameReady;
        frame_event.sequence_number = sequence;
        frame_event.generation = cycle;
        core->event_bus->publish(std::move(frame_event));

        if (!core->first_frame_received) {
            core->first_frame_received = true;
            first_frame = true;
        }
    }

    if (first_frame) {
        core->emit_status(cycle, k_status_started);
        StreamEvent first_event{};
        first_event.type = StreamEventType::FirstFrameReady;
        core->emit_if_current(cycle, std::move(first_event));
    }
    return true;
}

/** @brief Pull frames until the cycle is superseded, stopped, or fails. */
void stream_frames(const std::shared_ptr<SessionCore>& core,
                   std::uint64_t cycle,
                   const ConnectionConfig& config,
                   VideoSource& source) {
    const Resolution target = config.requested_resolution;
    while (true) {
        StreamState current_state{};
        bool resize_needed = false;
        {
            std::scoped_lock lock(core->mutex);
            if (!core->is_current_locked(cycle)) {
                return;
            }
            current_state = core->state;
            resize_needed = core->resize_needed;
        }
        if (current_state == StreamState::Paused) {
            std::this_thread::sleep_for(core->options.pause_poll_interval);
            continue;
        }
        if (current_state != StreamState::Streaming) {
            return;
        }

        cv::Mat raw_frame;
        bool read_ok = false;
        try {
            read_ok = source.read(raw_frame);
        } catch (const cv::Exception& exc) {
            core->logger->error("Frame decode raised: {}", exc.what());
        }
        if (!read_ok || raw_frame.empty()) {
            core->fail(cycle, StreamErrorKind::ReadFailure, k_error_read_failed);
            return;
        }

        if (resize_needed) {
            cv::Mat resized_frame;
            cv::resize(raw_frame, resized_frame, cv::Size(target.width_px, target.height_px));
            raw_frame = std::move(resized_frame);
        }

        if (!publish_frame(core, cycle, std::move(raw_frame))) {
            return;
        }
    }
}

void run_producer_loop(std::shared_ptr<SessionCore> core,
                       std::uint64_t cycle,
                       ConnectionConfig config,
                       std::promise<void> finished) {
    VideoSourcePtr source;
    bool failed = false;
    try {
        core->logger->info("Opening camera stream {}", masked_uri(config));
        const ConnectOutcome outcome = connect_source(core, cycle, build_uri(config), source);
        switch (outcome) {
            case ConnectOutcome::TimedOut:
                failed = core->fail(cycle, StreamErrorKind::ConnectTimeout, k_error_open_timed_out);
                break;
            case ConnectOutcome::OpenFailed:
                failed = core->fail(cycle, StreamErrorKind::ConnectFailure, k_error_open_failed);
                break;
            case ConnectOutcome::Abandoned:
                core->logger->info("Connect attempt abandoned by stop request");
                break;
            case ConnectOutcome::Connected:
                if (enter_streaming(core, cycle, config, *source)) {
                    stream_frames(core, cycle, config, *source);
                    std::scoped_lock lock(core->mutex);
                    failed = core->is_current_locked(cycle) && core->state == StreamState::Failed;
                }
                break;
        }
    } catch (const std::exception& exc) {
        core->logger->error("Producer loop failure: {}", exc.what());
        failed = core->fail(cycle, StreamErrorKind::ReadFailure, k_error_read_failed);
    }

    if (source != nullptr) {
        source->release();
        source.reset();
    }
    if (failed) {
        core->emit_status(cycle, k_status_stopped);
    }
    finished.set_value();
}

}  // namespace

StreamSession::StreamSession(SourceOpener opener,
                             std::shared_ptr<FrameBuffer> frame_buffer,
                             std::shared_ptr<StreamEventBus> event_bus,
                             StreamSessionOptions options)
    : core_(std::make_shared<Core>()),
      logger_(get_logger()) {
    core_->opener = std::move(opener);
    core_->options = options;
    core_->frame_buffer = std::move(frame_buffer);
    core_->event_bus = std::move(event_bus);
    core_->logger = logger_;
}

StreamSession::~StreamSession() {
    stop();
    std::scoped_lock lifecycle_lock(lifecycle_mutex_);
    reap_producer_thread();
}

bool StreamSession::start(const ConnectionConfig& config) {
    std::scoped_lock lifecycle_lock(lifecycle_mutex_);
    if (!config.is_startable()) {
        logger_->warn("Refusing to start streaming without a camera host");
        return false;
    }

    std::uint64_t cycle = 0;
    {
        std::scoped_lock lock(core_->mutex);
        if (core_->state != StreamState::Idle && core_->state != StreamState::Failed) {
            logger_->debug("Start ignored while {}", to_string(core_->state));
            return false;
        }
    }

    // A failed cycle leaves its finished thread behind.
    reap_producer_thread();

    {
        std::scoped_lock lock(core_->mutex);
        core_->bump_generation_locked();
        cycle = core_->generation;
        core_->state = StreamState::Connecting;
        core_->first_frame_received = false;
        core_->resize_needed = false;
        core_->native_resolution = Resolution{};
        core_->frames_published = 0;
    }
    core_->frame_buffer->clear();
    core_->emit_status(cycle, k_status_starting);

    std::promise<void> finished;
    producer_finished_ = finished.get_future();
    producer_thread_ = std::thread(run_producer_loop, core_, cycle, config, std::move(finished));
    return true;
}

void StreamSession::stop() {
    std::scoped_lock lifecycle_lock(lifecycle_mutex_);
    std::uint64_t cycle = 0;
    {
        std::scoped_lock lock(core_->mutex);
        const StreamState current = core_->state;
        if (current != StreamState::Connecting && current != StreamState::Streaming && current != StreamState::Paused) {
            return;
        }
        // Invalidates the running cycle so nothing it produces from here on is observed.
        core_->state = StreamState::Stopping;
        core_->bump_generation_locked();
        cycle = core_->generation;
    }
    core_->emit_status(cycle, k_status_stopping);

    reap_producer_thread();

    {
        std::scoped_lock lock(core_->mutex);
        core_->state = StreamState::Idle;
    }
    core_->emit_status(cycle, k_status_stopped);
}

bool StreamSession::pause(bool paused) {
    std::uint64_t cycle = 0;
    {
        std::scoped_lock lock(core_->mutex);
        if (core_->state != StreamState::Streaming && core_->state != StreamState::Paused) {
            return false;
        }
        core_->state = paused ? StreamState::Paused : StreamState::Streaming;
        cycle = core_->generation;
    }
    core_->emit_status(cycle, paused ? k_status_paused : k_status_playing);
    return true;
}

StreamState StreamSession::state() const {
    std::scoped_lock lock(core_->mutex);
    return core_->state;
}

bool StreamSession::is_active() const {
    const StreamState current = state();
    return current != StreamState::Idle && current != StreamState::Failed;
}

bool StreamSession::resize_needed() const {
    std::scoped_lock lock(core_->mutex);
    return core_->resize_needed;
}

Resolution StreamSession::native_resolution() const {
    std::scoped_lock lock(core_->mutex);
    return core_->native_resolution;
}

std::uint64_t StreamSession::frames_published() const {
    std::scoped_lock lock(core_->mutex);
    return core_->frames_published;
}

std::uint64_t StreamSession::generation() const {
    std::scoped_lock lock(core_->mutex);
    return core_->generation;
}

const std::shared_ptr<FrameBuffer>& StreamSession::frame_buffer() const noexcept {
    return core_->frame_buffer;
}

const std::shared_ptr<StreamEventBus>& StreamSession::event_bus() const noexcept {
    return core_->event_bus;
}

void StreamSession::reap_producer_thread() {
    if (!producer_thread_.joinable()) {
        return;
    }
    const auto wait_budget = std::chrono::duration_cast<SteadyClock::duration>(core_->options.stop_timeout);
    if (producer_finished_.valid() && producer_finished_.wait_for(wait_budget) != std::future_status::ready) {
        logger_->warn("Producer loop did not exit within {:.1f}s; detaching it", core_->options.stop_timeout.count());
        producer_thread_.detach();
        return;
    }
    producer_thread_.join();
}

}  // namespace ipcam_player
