#pragma once

#include "errors.hpp"
#include "event_queue.hpp"
#include "output/output.hpp"
#include "platform/audio_source.hpp"
#include "transcript_reducer.hpp"
#include "transcription/channel.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

enum class SessionState { Idle, Recording, Draining, Finalizing };

const char* to_string(SessionState state);

// What the controller does with a toggle, as judged when it is enqueued.
enum class ToggleAction { Start, Stop, Ignore, Queue };

const char* to_string(ToggleAction action);

struct SessionOptions {
    std::string endpoint;
    AudioFormat audio;
    std::chrono::milliseconds max_wait{10000};
    ReductionPolicy reduction = ReductionPolicy::LastFinal;
};

// Outcome of one dictation session, published once it is back in Idle.
struct SessionReport {
    uint64_t id = 0;
    std::string text;
    size_t frames_sent = 0;
    size_t finals = 0;
    size_t partials = 0;
    bool deadline_expired = false;
    bool output_invoked = false;
    // First failure that ended recording early (or prevented it).
    std::optional<Error> abort_reason;
    double duration_s = 0.0;
};

// Owns the Idle -> Recording -> Draining -> Finalizing -> Idle lifecycle.
//
// Every input (toggles, transcript events, pump failures, collector end,
// shutdown) goes through one inbox drained by the controller thread, which
// is the only writer of the state, the accumulator and the partial slot.
// The frame pump and event collector of a session are joined before the
// channel is closed.
class SessionController {
public:
    using StateCallback = std::function<void(SessionState)>;
    using CompletionCallback = std::function<void(const SessionReport&)>;

    SessionController(SessionOptions options, AudioSource& audio, ChannelConnector& connector,
                      OutputMethod& output, bool verbose = false);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Both callbacks run on the controller thread. Set them before start().
    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }
    void set_completion_callback(CompletionCallback cb) { on_complete_ = std::move(cb); }

    void start();

    // Thread-safe. Starts a session when Idle, stops it when Recording and
    // is ignored while Draining. Queue means the toggle waits behind a
    // session that is still connecting, still typing, or behind earlier
    // toggles, and is applied once those are done.
    ToggleAction toggle();

    // Stops a session in flight (drained, but not typed) and joins the
    // controller thread. Idempotent.
    void shutdown();

    SessionState state() const { return state_.load(std::memory_order_acquire); }
    std::optional<SessionReport> last_report() const;

private:
    struct Toggle {
        ToggleAction action;
    };
    struct Shutdown {};
    struct Transcript {
        uint64_t session;
        TranscriptEvent event;
    };
    struct PumpFailed {
        uint64_t session;
        Error error;
    };
    struct CollectorDone {
        uint64_t session;
    };
    using Message = std::variant<Toggle, Shutdown, Transcript, PumpFailed, CollectorDone>;

    void run();
    void run_session();

    bool open_session();
    void record();
    void drain();
    void finalize();

    void pump_frames(uint64_t session);
    void collect_events(uint64_t session);

    void set_state(SessionState state);
    void note_abort(const Error& error);
    void publish(SessionReport report);
    void log(const std::string& msg);

    SessionOptions options_;
    AudioSource& audio_source_;
    ChannelConnector& connector_;
    OutputMethod& output_;
    bool verbose_;

    StateCallback on_state_;
    CompletionCallback on_complete_;

    EventQueue<Message> inbox_;
    std::atomic<SessionState> state_{SessionState::Idle};
    std::jthread thread_;
    bool shutdown_requested_ = false;

    // Bookkeeping for toggle() replies. opening_ covers connecting and
    // opening the microphone, while the state still reads Idle. State
    // changes take toggle_mutex_ too.
    std::mutex toggle_mutex_;
    std::atomic<int> pending_toggles_{0};
    std::atomic<bool> opening_{false};

    // Current session, touched only by the controller thread (the pump and
    // collector get their own references and report through the inbox).
    uint64_t session_id_ = 0;
    std::unique_ptr<AudioStream> audio_;
    std::unique_ptr<TranscriptionChannel> channel_;
    std::jthread pump_;
    std::jthread collector_;
    size_t frames_sent_ = 0;
    bool collector_done_ = false;
    TranscriptAccumulator accumulator_;
    SessionReport report_;
    std::chrono::steady_clock::time_point started_;

    mutable std::mutex report_mutex_;
    std::optional<SessionReport> last_report_;
};
