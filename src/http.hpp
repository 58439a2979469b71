#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace genai {

// Process-wide transport setup. http_init() initialises libcurl where it is
// used and does nothing on Linux (OpenSSL 1.1+ initialises itself).
void http_init();
void http_cleanup();

// Flag polled by every in-flight transfer (about once a second). Setting it
// aborts them all; the CLI points it at its SIGINT flag.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0: no complete response (connect/TLS failure, cut-off body, abort)
    std::string body;
    bool timed_out = false; // with status 0: the exchange outlived its timeout
};

inline bool is_success_status(long status_code) {
    return status_code >= 200 && status_code < 300;
}

// Receives raw body bytes of a 2xx response. Return false to abort.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Transport seam; tests inject MockHttpClient.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // POST and buffer the whole response body.
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    // POST and hand the body of a 2xx response to callback as it arrives.
    // Any other status delivers no chunk; its body is buffered into the
    // returned response. The transfer stops when callback returns false or
    // *cancel becomes true; the 2xx status is then kept. A 2xx body that ends
    // early for any other reason reports status 0.
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         RawChunkCallback callback,
                                         long timeout_seconds = 300,
                                         const std::atomic<bool>* cancel = nullptr) = 0;
};

// One concrete client per platform; CMakeLists.txt compiles the matching
// source file.
#ifdef __linux__

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long timeout_seconds = 300,
                                 const std::atomic<bool>* cancel = nullptr) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
    HttpResponse stream_post_raw(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 long timeout_seconds = 300,
                                 const std::atomic<bool>* cancel = nullptr) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace genai
