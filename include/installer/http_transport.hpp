#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace installer {

struct HttpRequest {
    std::string url;
    // Non-zero asks the server for "bytes=<offset>-".
    std::uint64_t offset{0};
    std::string user_agent;
};

class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    // Called once per transfer, before the first body byte, or after the
    // transfer when the body is empty. Returning false aborts the transfer.
    virtual bool onResponse(long status, std::optional<std::uint64_t> content_length) = 0;

    // Returning false aborts the transfer.
    virtual bool onData(const char* data, std::size_t size) = 0;
};

struct TransferResult {
    bool completed{false};
    // The handler stopped the transfer; error is empty in that case.
    bool aborted{false};
    long status{0};
    std::string error;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual TransferResult fetch(const HttpRequest& request, ResponseHandler& handler) = 0;
};

// libcurl easy-interface implementation. One handle per fetch, so a single
// instance can serve many concurrent tasks.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(long connect_timeout_seconds = 30);
    ~CurlTransport() override;

    TransferResult fetch(const HttpRequest& request, ResponseHandler& handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace installer
