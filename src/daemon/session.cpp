#include "session.hpp"

#include <format>
#include <print>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Draining: return "draining";
        case SessionState::Finalizing: return "finalizing";
    }
    return "unknown";
}

const char* to_string(ToggleAction action) {
    switch (action) {
        case ToggleAction::Start: return "starting";
        case ToggleAction::Stop: return "stopping";
        case ToggleAction::Ignore: return "ignored";
        case ToggleAction::Queue: return "queued";
    }
    return "unknown";
}

SessionController::SessionController(SessionOptions options, AudioSource& audio,
                                     ChannelConnector& connector, OutputMethod& output,
                                     bool verbose)
    : options_(std::move(options)), audio_source_(audio), connector_(connector),
      output_(output), verbose_(verbose), accumulator_(options_.reduction) {}

SessionController::~SessionController() {
    shutdown();
}

void SessionController::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this] { run(); });
}

ToggleAction SessionController::toggle() {
    std::lock_guard lock(toggle_mutex_);

    auto action = ToggleAction::Queue;
    if (pending_toggles_.load(std::memory_order_acquire) == 0 &&
        !opening_.load(std::memory_order_acquire)) {
        switch (state()) {
            case SessionState::Idle: action = ToggleAction::Start; break;
            case SessionState::Recording: action = ToggleAction::Stop; break;
            case SessionState::Draining: action = ToggleAction::Ignore; break;
            case SessionState::Finalizing: action = ToggleAction::Queue; break;
        }
    }

    pending_toggles_.fetch_add(1, std::memory_order_acq_rel);
    inbox_.push(Toggle{action});
    return action;
}

void SessionController::shutdown() {
    if (!thread_.joinable()) return;
    inbox_.push(Shutdown{});
    thread_.join();
}

std::optional<SessionReport> SessionController::last_report() const {
    std::lock_guard lock(report_mutex_);
    return last_report_;
}

void SessionController::run() {
    while (!shutdown_requested_) {
        auto msg = inbox_.pop();

        if (std::holds_alternative<Shutdown>(msg)) {
            shutdown_requested_ = true;
        } else if (auto* t = std::get_if<Toggle>(&msg)) {
            // Left over from a drain that hit its deadline first
            if (t->action == ToggleAction::Ignore) {
                pending_toggles_.fetch_sub(1, std::memory_order_acq_rel);
                continue;
            }
            {
                std::lock_guard lock(toggle_mutex_);
                opening_.store(true, std::memory_order_release);
                pending_toggles_.fetch_sub(1, std::memory_order_acq_rel);
            }
            run_session();
        }
        // Anything else is left over from a finished session.
    }
}

void SessionController::run_session() {
    session_id_++;
    accumulator_ = TranscriptAccumulator(options_.reduction);
    report_ = SessionReport{.id = session_id_};
    frames_sent_ = 0;
    collector_done_ = false;
    started_ = std::chrono::steady_clock::now();

    if (!open_session()) {
        // Nothing was streamed, so there is nothing to drain.
        finalize();
        return;
    }

    record();
    drain();
    finalize();
}

bool SessionController::open_session() {
    auto channel = connector_.connect(options_.endpoint);
    if (!channel) {
        std::println(stderr, "session: cannot reach recognizer: {}", channel.error().message);
        note_abort(channel.error());
        return false;
    }
    channel_ = std::move(*channel);

    auto stream = audio_source_.open(options_.audio);
    if (!stream) {
        std::println(stderr, "session: cannot open microphone: {}", stream.error().message);
        note_abort(stream.error());
        return false;
    }
    audio_ = std::move(*stream);

    set_state(SessionState::Recording);
    log("Recording started");

    uint64_t id = session_id_;
    pump_ = std::jthread([this, id] { pump_frames(id); });
    collector_ = std::jthread([this, id] { collect_events(id); });
    return true;
}

void SessionController::record() {
    while (true) {
        auto msg = inbox_.pop();

        if (std::holds_alternative<Toggle>(msg)) {
            pending_toggles_.fetch_sub(1, std::memory_order_acq_rel);
            log("Stop requested");
            return;
        }

        if (std::holds_alternative<Shutdown>(msg)) {
            shutdown_requested_ = true;
            return;
        }

        if (auto* t = std::get_if<Transcript>(&msg)) {
            if (t->session == session_id_) accumulator_.apply(t->event);
            continue;
        }

        if (auto* f = std::get_if<PumpFailed>(&msg)) {
            if (f->session != session_id_) continue;
            std::println(stderr, "session: {} error while recording: {}",
                         to_string(f->error.kind), f->error.message);
            note_abort(f->error);
            return;
        }

        if (auto* d = std::get_if<CollectorDone>(&msg)) {
            if (d->session != session_id_) continue;
            log("Recognizer ended the stream while recording");
            collector_done_ = true;
            note_abort(Error{ErrorKind::Send, "recognizer closed the stream"});
            return;
        }
    }
}

void SessionController::drain() {
    set_state(SessionState::Draining);

    // Closing the stream wakes the pump; it forwards the buffered tail and exits.
    audio_->close();
    if (pump_.joinable()) pump_.join();

    if (!collector_done_) {
        if (auto res = channel_->signal_end_of_audio(); !res) {
            log("End-of-audio signal failed: " + res.error().message);
        }
    }

    log(std::format("Waiting up to {}ms for remaining results", options_.max_wait.count()));
    auto deadline = std::chrono::steady_clock::now() + options_.max_wait;

    while (!collector_done_) {
        auto msg = inbox_.pop_until(deadline);
        if (!msg) {
            log("Drain deadline reached");
            report_.deadline_expired = true;
            return;
        }

        if (auto* t = std::get_if<Transcript>(&*msg)) {
            if (t->session != session_id_) continue;
            accumulator_.apply(t->event);
            if (t->event.kind == TranscriptEvent::Kind::EndOfStream) return;
        } else if (auto* d = std::get_if<CollectorDone>(&*msg)) {
            if (d->session == session_id_) collector_done_ = true;
        } else if (std::holds_alternative<Shutdown>(*msg)) {
            shutdown_requested_ = true;
        } else if (std::holds_alternative<Toggle>(*msg)) {
            pending_toggles_.fetch_sub(1, std::memory_order_acq_rel);
            log("Toggle ignored, session is already stopping");
        }
        // A PumpFailed here raced with the stop request; the pump is gone.
    }
}

void SessionController::finalize() {
    set_state(SessionState::Finalizing);

    if (channel_) channel_->interrupt();
    if (pump_.joinable()) pump_.join();
    if (collector_.joinable()) collector_.join();

    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    if (audio_) {
        audio_->close();
        audio_.reset();
    }

    report_.text = accumulator_.result();
    report_.finals = accumulator_.finals();
    report_.partials = accumulator_.partials();
    report_.frames_sent = frames_sent_;
    report_.duration_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_).count();

    log(std::format("Session {} finished: {} frames, {} finals, {} partials, {} chars",
                    report_.id, report_.frames_sent, report_.finals, report_.partials,
                    report_.text.size()));

    if (!report_.text.empty() && !shutdown_requested_) {
        report_.output_invoked = true;
        auto res = output_.deliver(report_.text);
        if (!res) {
            std::println(stderr, "session: output delivery incomplete: {}", res.error());
        }
    }

    set_state(SessionState::Idle);
    publish(std::move(report_));
}

void SessionController::pump_frames(uint64_t session) {
    while (true) {
        auto frame = audio_->read();
        if (!frame) {
            if (frame.error().kind != ErrorKind::Closed) {
                inbox_.push(PumpFailed{session, frame.error()});
            }
            return;
        }

        auto res = channel_->send(std::move(*frame));
        if (!res) {
            inbox_.push(PumpFailed{session, res.error()});
            return;
        }
        frames_sent_++;
    }
}

void SessionController::collect_events(uint64_t session) {
    while (auto event = channel_->next_event()) {
        inbox_.push(Transcript{session, std::move(*event)});
    }
    inbox_.push(CollectorDone{session});
}

void SessionController::set_state(SessionState state) {
    {
        // toggle() judges state and opening_ together
        std::lock_guard lock(toggle_mutex_);
        state_.store(state, std::memory_order_release);
        if (state != SessionState::Idle) opening_.store(false, std::memory_order_release);
    }
    if (on_state_) on_state_(state);
}

void SessionController::note_abort(const Error& error) {
    if (!report_.abort_reason) report_.abort_reason = error;
}

void SessionController::publish(SessionReport report) {
    {
        std::lock_guard lock(report_mutex_);
        last_report_ = report;
    }
    if (on_complete_) on_complete_(report);
}

void SessionController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[keyscribe] {}", msg);
    }
}
