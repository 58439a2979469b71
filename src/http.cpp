#include "http.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

namespace genai {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

static bool flag_set(const std::atomic<bool>* flag) {
    return flag && flag->load(std::memory_order_relaxed);
}

// Called by curl ~once per second; return non-zero to abort the transfer.
// clientp is the per-request cancel flag (may be null).
static int abort_progress_cb(void* clientp,
                             curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
    if (flag_set(g_http_abort_flag) || flag_set(cancel))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl, const std::atomic<bool>* cancel) {
    if (g_http_abort_flag || cancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                         const_cast<std::atomic<bool>*>(cancel));
    }
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Routes body bytes either to the caller (2xx) or into the error body.
struct RawStreamContext {
    CURL* curl = nullptr;
    RawChunkCallback* callback = nullptr;
    const std::atomic<bool>* cancel = nullptr;
    std::string error_body;
    bool aborted = false;
};

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->aborted) return 0;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (!is_success_status(status)) {
        ctx->error_body.append(ptr, total);
        return total;
    }

    if (flag_set(ctx->cancel) || !(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }

    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_post(CurlRequest& req, const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers, long timeout,
                       const std::atomic<bool>* cancel) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    apply_abort_hook(req.curl, cancel);
}

// ── CurlHttpClient ────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};
    setup_post(req, url, body, headers, timeout_seconds, nullptr);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        std::cerr << "[http] POST " << url << " failed: " << curl_easy_strerror(res) << "\n";
        HttpResponse failed;
        failed.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        return failed;
    }
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

HttpResponse CurlHttpClient::stream_post_raw(const std::string& url,
                                             const std::string& body,
                                             const std::vector<Header>& headers,
                                             RawChunkCallback callback,
                                             long timeout_seconds,
                                             const std::atomic<bool>* cancel) {
    CurlRequest req;
    if (!req) return {};
    setup_post(req, url, body, headers, timeout_seconds, cancel);
    RawStreamContext ctx;
    ctx.curl = req.curl;
    ctx.callback = &callback;
    ctx.cancel = cancel;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    HttpResponse response;
    CURLcode res = curl_easy_perform(req.curl);
    // A transfer stopped by the callback or the cancel flag still has a status.
    bool stopped = ctx.aborted || flag_set(cancel);
    if (res != CURLE_OK && !stopped) {
        std::cerr << "[http] stream " << url << " failed: " << curl_easy_strerror(res) << "\n";
        response.timed_out = (res == CURLE_OPERATION_TIMEDOUT);
        return response;
    }
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (!is_success_status(response.status_code))
        response.body = std::move(ctx.error_body);
    return response;
}

} // namespace genai
