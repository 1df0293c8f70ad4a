#include "transcription/websocket_channel.hpp"

#include "wav_encoder.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <type_traits>
#include <unistd.h>

namespace {

constexpr int kSendPollMs = 1000;
constexpr int kSendAttempts = 5;
// TLS may hold decrypted bytes the socket no longer signals, so re-check curl periodically.
constexpr int kRecvPollMs = 100;

// Newer libcurl hands out the frame metadata as a pointer to const.
template <typename F> struct MetaArg;
template <typename R, typename A0, typename A1, typename A2, typename A3, typename A4>
struct MetaArg<R (*)(A0, A1, A2, A3, A4)> {
    using type = std::remove_pointer_t<A4>;
};
using WsFramePtr = MetaArg<decltype(&curl_ws_recv)>::type;

} // namespace

CurlWsTransport::~CurlWsTransport() {
    curl_easy_cleanup(curl_);
}

CURLcode CurlWsTransport::send(const void* data, size_t len, unsigned int flags) {
    size_t sent = 0;
    return curl_ws_send(curl_, data, len, &sent, 0, flags);
}

CURLcode CurlWsTransport::recv(char* buf, size_t len, WsChunk& chunk) {
    size_t got = 0;
    WsFramePtr meta = nullptr;
    CURLcode rc = curl_ws_recv(curl_, buf, len, &got, &meta);
    if (rc == CURLE_OK) {
        chunk.size = got;
        chunk.flags = meta ? meta->flags : 0;
        chunk.bytesleft = meta ? meta->bytesleft : 0;
    }
    return rc;
}

int CurlWsTransport::socket_fd() {
    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK) return -1;
    return sock == CURL_SOCKET_BAD ? -1 : static_cast<int>(sock);
}

WebSocketChannel::WebSocketChannel(std::unique_ptr<WsTransport> transport, WebSocketOptions options)
    : transport_(std::move(transport)), options_(options) {
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "channel: eventfd failed: {}", std::strerror(errno));
    }
}

WebSocketChannel::~WebSocketChannel() {
    close();
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

int WebSocketChannel::socket_fd() {
    std::lock_guard lock(io_mutex_);
    return transport_ ? transport_->socket_fd() : -1;
}

std::expected<void, Error> WebSocketChannel::send(AudioFrame frame) {
    if (!open_.load(std::memory_order_acquire)) {
        return std::unexpected(Error{ErrorKind::Send, "connection closed"});
    }

    if (options_.send_wav_header && !header_sent_) {
        auto header = wav::stream_header(options_.sample_rate, options_.channels);
        if (auto res = send_binary(header.data(), header.size()); !res) return res;
        header_sent_ = true;
    }

    return send_binary(frame.samples.data(), frame.samples.size() * sizeof(int16_t));
}

std::expected<void, Error> WebSocketChannel::signal_end_of_audio() {
    if (!open_.load(std::memory_order_acquire)) {
        return std::unexpected(Error{ErrorKind::Send, "connection closed"});
    }
    // The server treats an empty binary message as end of audio
    return send_binary("", 0);
}

std::expected<void, Error> WebSocketChannel::send_binary(const void* data, size_t len) {
    for (int attempt = 0; attempt < kSendAttempts; attempt++) {
        CURLcode rc;
        {
            std::lock_guard lock(io_mutex_);
            if (!transport_) {
                return std::unexpected(Error{ErrorKind::Send, "connection closed"});
            }
            rc = transport_->send(data, len, CURLWS_BINARY);
            if (rc == CURLE_OK) return {};
        }

        if (rc != CURLE_AGAIN) {
            open_.store(false, std::memory_order_release);
            return std::unexpected(Error{ErrorKind::Send,
                std::string("send failed: ") + curl_easy_strerror(rc)});
        }

        int fd = socket_fd();
        if (fd < 0) break;
        pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
        ::poll(&pfd, 1, kSendPollMs);
    }

    open_.store(false, std::memory_order_release);
    return std::unexpected(Error{ErrorKind::Send, "send timed out"});
}

WebSocketChannel::ReadResult WebSocketChannel::read_message(std::string& message) {
    std::lock_guard lock(io_mutex_);
    if (!transport_) return ReadResult::Closed;

    char buf[4096];
    while (true) {
        WsChunk chunk;
        CURLcode rc = transport_->recv(buf, sizeof(buf), chunk);

        if (rc == CURLE_AGAIN) return ReadResult::Again;
        if (rc != CURLE_OK) {
            if (rc != CURLE_GOT_NOTHING) {
                std::println(stderr, "channel: receive failed: {}", curl_easy_strerror(rc));
            }
            return ReadResult::Closed;
        }

        if (chunk.flags & CURLWS_CLOSE) return ReadResult::Closed;
        if (chunk.flags & CURLWS_PING) continue;

        partial_message_.append(buf, chunk.size);
        if (chunk.bytesleft == 0 && !(chunk.flags & CURLWS_CONT)) {
            if (chunk.flags & CURLWS_BINARY) {
                // Only JSON text messages carry transcripts
                partial_message_.clear();
                continue;
            }
            message = std::move(partial_message_);
            partial_message_.clear();
            return ReadResult::Message;
        }
    }
}

bool WebSocketChannel::wait_readable() {
    int fd = socket_fd();
    if (fd < 0) return false;

    pollfd fds[2] = {
        {.fd = fd, .events = POLLIN, .revents = 0},
        {.fd = wake_fd_, .events = POLLIN, .revents = 0},
    };
    nfds_t count = wake_fd_ >= 0 ? 2 : 1;

    while (true) {
        int n = ::poll(fds, count, kRecvPollMs);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (count == 2 && (fds[1].revents & POLLIN)) return false;
        return true;
    }
}

std::optional<TranscriptEvent> WebSocketChannel::next_event() {
    while (true) {
        if (interrupted_.load(std::memory_order_acquire) || ended_) return std::nullopt;

        if (!pending_.empty()) {
            auto ev = std::move(pending_.front());
            pending_.pop_front();
            if (ev.kind == TranscriptEvent::Kind::EndOfStream) ended_ = true;
            return ev;
        }

        std::string message;
        switch (read_message(message)) {
            case ReadResult::Message:
                for (auto& ev : decoder_.decode(message)) {
                    pending_.push_back(std::move(ev));
                }
                break;
            case ReadResult::Again:
                if (!wait_readable()) return std::nullopt;
                break;
            case ReadResult::Closed:
                open_.store(false, std::memory_order_release);
                return std::nullopt;
        }
    }
}

void WebSocketChannel::interrupt() {
    interrupted_.store(true, std::memory_order_release);
    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(wake_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "channel: wakeup write failed: {}", std::strerror(errno));
        }
    }
}

void WebSocketChannel::close() {
    std::lock_guard lock(io_mutex_);
    if (!transport_) return;

    if (open_.exchange(false)) {
        if (CURLcode rc = transport_->send("", 0, CURLWS_CLOSE); rc != CURLE_OK) {
            std::println(stderr, "channel: close frame not sent: {}", curl_easy_strerror(rc));
        }
    }
    transport_.reset();
}

WebSocketConnector::WebSocketConnector(WebSocketOptions options)
    : options_(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WebSocketConnector::~WebSocketConnector() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<TranscriptionChannel>, Error>
WebSocketConnector::connect(const std::string& endpoint) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorKind::Connect, "curl_easy_init failed"});
    }

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    // 2 = perform the WebSocket upgrade, then hand the connection to us
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
    // Bound the whole upgrade, not just the TCP connect
    long timeout = static_cast<long>(options_.connect_timeout.count());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        return std::unexpected(Error{ErrorKind::Connect,
            endpoint + ": " + curl_easy_strerror(res)});
    }

    // The session itself has no time limit
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 0L);

    return std::make_unique<WebSocketChannel>(std::make_unique<CurlWsTransport>(curl), options_);
}
