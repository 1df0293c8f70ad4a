#pragma once

#include <cstddef>
#include <curl/curl.h>

// Metadata of one received piece of a WebSocket message.
struct WsChunk {
    size_t size = 0;
    int flags = 0;              // CURLWS_* bits
    curl_off_t bytesleft = 0;   // still to come for this frame
};

// Raw WebSocket I/O on an established connection. Return codes follow
// libcurl: CURLE_AGAIN when the call would block. Callers serialize access.
class WsTransport {
public:
    virtual ~WsTransport() = default;

    virtual CURLcode send(const void* data, size_t len, unsigned int flags) = 0;
    virtual CURLcode recv(char* buf, size_t len, WsChunk& chunk) = 0;

    // Descriptor to poll for readiness, -1 when there is none.
    virtual int socket_fd() = 0;
};

// The easy handle left behind by a CONNECT_ONLY upgrade. Owns it.
class CurlWsTransport : public WsTransport {
public:
    explicit CurlWsTransport(CURL* curl) : curl_(curl) {}
    ~CurlWsTransport() override;

    CurlWsTransport(const CurlWsTransport&) = delete;
    CurlWsTransport& operator=(const CurlWsTransport&) = delete;

    CURLcode send(const void* data, size_t len, unsigned int flags) override;
    CURLcode recv(char* buf, size_t len, WsChunk& chunk) override;
    int socket_fd() override;

private:
    CURL* curl_;
};
