#include "installer/http_transport.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace installer {

namespace {

// curl_global_init is not thread-safe; do it once, before the first handle.
class CurlGlobal {
public:
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void ensureCurlInitialized() {
    static CurlGlobal global;
}

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(long connect_timeout_seconds)
        : connect_timeout_(connect_timeout_seconds) {
        ensureCurlInitialized();
    }

    TransferResult fetch(const HttpRequest& request, ResponseHandler& handler) const {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        TransferResult result;
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            result.error = "Failed to allocate curl handle";
            return result;
        }

        TransferContext ctx{curl.get(), &handler};
        const std::string range = std::to_string(request.offset) + "-";

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connect_timeout_);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        if (!request.user_agent.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, request.user_agent.c_str());
        }
        if (request.offset > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        const CURLcode res = curl_easy_perform(curl.get());
        result.status = responseCode(curl.get());

        // Bodiless responses (a bare 416, an empty file) never reach the write callback.
        if (res == CURLE_OK && !ctx.responded) {
            ctx.responded = true;
            ctx.aborted = !handler.onResponse(result.status, contentLength(curl.get()));
        }

        if (ctx.aborted) {
            result.aborted = true;
            return result;
        }
        if (res != CURLE_OK) {
            result.error = std::string{"curl error: "} + curl_easy_strerror(res);
            spdlog::debug("Transfer of {} failed: {}", request.url, result.error);
            return result;
        }

        result.completed = true;
        return result;
    }

private:
    struct TransferContext {
        CURL* handle{nullptr};
        ResponseHandler* handler{nullptr};
        bool responded{false};
        bool aborted{false};
    };

    static long responseCode(CURL* handle) {
        long code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    static std::optional<std::uint64_t> contentLength(CURL* handle) {
        curl_off_t length = -1;
        // -1 when the server sent no Content-Length.
        if (curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK ||
            length < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(length);
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->handler) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!ctx->responded) {
            ctx->responded = true;
            if (!ctx->handler->onResponse(responseCode(ctx->handle), contentLength(ctx->handle))) {
                ctx->aborted = true;
                return 0;
            }
        }

        if (total == 0) {
            return 0;
        }
        if (!ctx->handler->onData(ptr, total)) {
            ctx->aborted = true;
            return 0;
        }
        return total;
    }

    long connect_timeout_;
};

CurlTransport::CurlTransport(long connect_timeout_seconds)
    : impl_(std::make_unique<Impl>(connect_timeout_seconds)) {}

CurlTransport::~CurlTransport() = default;

TransferResult CurlTransport::fetch(const HttpRequest& request, ResponseHandler& handler) {
    return impl_->fetch(request, handler);
}

} // namespace installer
