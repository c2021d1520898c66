#include "net/curl_http_client.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace centy {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

struct TransferCtx {
    std::vector<std::uint8_t>* body = nullptr;
    IProgress* progress = nullptr;
    std::string_view label;
};

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nmemb;
    ctx->body->insert(ctx->body->end(),
                      reinterpret_cast<const std::uint8_t*>(ptr),
                      reinterpret_cast<const std::uint8_t*>(ptr) + n);
    return n;
}

int XferInfoCb(void* userdata,
               curl_off_t total_down,
               curl_off_t now_down,
               curl_off_t /*total_up*/,
               curl_off_t /*now_up*/) {
    if (g_cancel.load(std::memory_order_relaxed)) {
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    auto* ctx = static_cast<TransferCtx*>(userdata);
    if (ctx->progress && now_down > 0) {
        ProgressEvent event{};
        event.label = ctx->label;
        event.done = static_cast<std::uint64_t>(now_down);
        event.total = total_down > 0 ? static_cast<std::uint64_t>(total_down) : 0;
        ctx->progress->OnProgress(event);
    }
    return 0;
}

} // namespace

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options opt) : opt_(std::move(opt)) {
    EnsureCurlGlobalInit();
}

std::expected<HttpResponse, std::string> CurlHttpClient::Get(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return std::unexpected("curl_easy_init failed");

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    for (const auto& h : request.headers) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next) return std::unexpected("curl_slist_append failed");
        (void)headers.release();
        headers.reset(next);
    }

    HttpResponse response;
    TransferCtx ctx;
    ctx.body = &response.body;
    ctx.progress = request.progress;
    ctx.label = request.label.empty() ? std::string_view(request.url) : std::string_view(request.label);

    char errbuf[CURL_ERROR_SIZE]{};

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, opt_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_sec);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, opt_.timeout_sec);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, WriteCb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, XferInfoCb);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &ctx);
    if (headers) {
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
    }

    LogDebug("GET %s", request.url.c_str());

    const CURLcode rc = curl_easy_perform(c);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("transfer cancelled");
    }
    if (rc != CURLE_OK) {
        std::string msg = curl_easy_strerror(rc);
        if (errbuf[0] != '\0') {
            msg += ": ";
            msg += errbuf;
        }
        return std::unexpected(msg);
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &response.status);
    LogDebug("GET %s -> HTTP %ld (%zu bytes)", request.url.c_str(), response.status, response.body.size());
    return response;
}

} // namespace centy
