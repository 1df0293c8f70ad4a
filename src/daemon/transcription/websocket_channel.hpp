#pragma once

#include "transcription/channel.hpp"
#include "transcription/live_protocol.hpp"
#include "transcription/ws_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

struct WebSocketOptions {
    std::chrono::seconds connect_timeout{10};
    bool send_wav_header = true;
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
};

// Recognizer connection over a WebSocket transport. The transport is shared
// by the pump and collector threads, so every call into it happens under
// io_mutex_ and the collector never blocks inside it: it waits in poll() on
// the socket and an eventfd used by interrupt().
class WebSocketChannel : public TranscriptionChannel {
public:
    WebSocketChannel(std::unique_ptr<WsTransport> transport, WebSocketOptions options);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    std::expected<void, Error> send(AudioFrame frame) override;
    std::optional<TranscriptEvent> next_event() override;
    std::expected<void, Error> signal_end_of_audio() override;
    void interrupt() override;
    void close() override;

private:
    enum class ReadResult { Message, Again, Closed };

    std::expected<void, Error> send_binary(const void* data, size_t len);
    ReadResult read_message(std::string& message);
    bool wait_readable();
    int socket_fd();

    std::unique_ptr<WsTransport> transport_;
    WebSocketOptions options_;
    std::mutex io_mutex_;
    int wake_fd_ = -1;

    bool header_sent_ = false;
    std::atomic<bool> open_{true};
    std::atomic<bool> interrupted_{false};
    bool ended_ = false;

    LiveProtocolDecoder decoder_;
    std::deque<TranscriptEvent> pending_;
    std::string partial_message_;
};

class WebSocketConnector : public ChannelConnector {
public:
    explicit WebSocketConnector(WebSocketOptions options);
    ~WebSocketConnector() override;

    WebSocketConnector(const WebSocketConnector&) = delete;
    WebSocketConnector& operator=(const WebSocketConnector&) = delete;

    // The whole upgrade, TCP connect included, is bounded by connect_timeout.
    std::expected<std::unique_ptr<TranscriptionChannel>, Error>
        connect(const std::string& endpoint) override;

private:
    WebSocketOptions options_;
};
