// Linux transport: HTTP/1.1 over POSIX sockets, TLS through OpenSSL.
// Behaves like the libcurl client in http.cpp; one request per connection.
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace genai {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static std::optional<ParsedUrl> parse_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    ParsedUrl result;
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "https" && scheme != "http") return std::nullopt;
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty()) return std::nullopt;

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    explicit Connection(const std::atomic<bool>* cancel) : cancel_(cancel) {}
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        deadline_ = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);

        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;
            connected = connect_with_timeout(ai, timeout_secs);
            if (!connected) { ::close(fd_); fd_ = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        // Full timeout for the TLS handshake, then 1-second slices so the
        // cancel flags are polled while the body streams.
        if (url.tls) {
            set_socket_timeout(timeout_secs);
            if (!handshake(url.host)) return false;
        }
        set_socket_timeout(1);
        return true;
    }

    bool aborted() const {
        auto set = [](const std::atomic<bool>* f) {
            return f && f->load(std::memory_order_relaxed);
        };
        return set(g_socket_abort_flag) || set(cancel_);
    }

    bool timed_out() const { return timed_out_; }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error, abort or
    // when the exchange outlives its timeout. A 1-second slice expiry loops
    // back so the abort flags and the deadline are re-checked.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (aborted()) return -1;
            if (std::chrono::steady_clock::now() >= deadline_) {
                std::cerr << "[http] timed out waiting for response data\n";
                timed_out_ = true;
                return -1;
            }

            ssize_t n;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return -1;
            }
            n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return -1;
        }
    }

    bool write_all(const std::string& data) {
        const char* buf = data.data();
        size_t len = data.size();
        while (len > 0) {
            if (aborted()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool connect_with_timeout(const struct addrinfo* ai, long timeout_secs) {
        // Non-blocking connect so we can honour timeout_secs.
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0) {
            if (errno != EINPROGRESS) return false;
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd_, &wset);
            struct timeval tv{timeout_secs, 0};
            if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
            if (err != 0) return false;
        }
        fcntl(fd_, F_SETFL, flags);
        return true;
    }

    bool handshake(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str()); // SNI
        SSL_set1_host(ssl_, host.c_str());

        if (SSL_connect(ssl_) != 1) {
            unsigned long code = ERR_get_error();
            char msg[256];
            ERR_error_string_n(code, msg, sizeof(msg));
            std::cerr << "[http] TLS handshake with " << host << " failed: " << msg << "\n";
            return false;
        }
        return true;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    const std::atomic<bool>* cancel_;
    std::chrono::steady_clock::time_point deadline_;
    bool     timed_out_ = false;
    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Response reader ───────────────────────────────────────────

// How a response body ended.
enum class BodyResult {
    Complete,  // final chunk, Content-Length reached, or orderly close
    Stopped,   // the sink returned false
    Truncated, // connection lost, read error, deadline or abort mid-body
};

// Reads the status line, headers and body of one response from a
// connection. `pending_` holds bytes read past the current parse point.
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Returns the status code, or 0 if no valid status line was read.
    long read_head() {
        std::string status_line;
        if (!read_line(status_line)) return 0;

        // "HTTP/1.1 200 OK": the code follows the first space
        size_t sp = status_line.find(' ');
        if (status_line.rfind("HTTP/", 0) != 0 || sp == std::string::npos) return 0;
        long status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
        if (status < 100 || status > 599) return 0;

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string name  = lowercase(line.substr(0, colon));
            std::string value = lowercase(line.substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding")
                chunked_ = (value.find("chunked") != std::string::npos);
            else if (name == "content-length") {
                content_length_ = std::strtoull(value.c_str(), nullptr, 10);
                has_length_ = true;
            }
        }
        return status;
    }

    // Delivers body bytes to sink as they arrive (dechunking if needed).
    // A chunked body is complete only once its zero-size chunk arrives.
    template <typename Sink>
    BodyResult read_body(Sink&& sink) {
        if (chunked_) {
            std::string size_line;
            while (read_line(size_line)) {
                if (size_line.empty()) continue;
                // Chunk size is hex, may have extensions after ';'
                size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk_size == 0) return BodyResult::Complete;
                BodyResult result = pass_through(chunk_size, sink);
                if (result != BodyResult::Complete) return result;
                std::string crlf;
                if (!read_line(crlf)) return BodyResult::Truncated; // trailing \r\n
            }
            return BodyResult::Truncated;
        }
        if (has_length_) return pass_through(content_length_, sink);
        return pass_through(std::string::npos, sink); // read to close
    }

private:
    static std::string lowercase(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n < 0) read_failed_ = true;
        if (n <= 0) return false;
        pending_.append(buf, static_cast<size_t>(n));
        return true;
    }

    // Read a CRLF-terminated line; false on EOF/error before a newline.
    bool read_line(std::string& line) {
        size_t pos;
        while ((pos = pending_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        line = pending_.substr(0, pos);
        pending_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    // Forward n bytes (npos = until EOF) to sink.
    template <typename Sink>
    BodyResult pass_through(size_t n, Sink& sink) {
        while (n > 0) {
            if (pending_.empty() && !fill()) {
                // Only a read-to-close body may end at EOF
                bool clean_eof = (n == std::string::npos && !read_failed_);
                return clean_eof ? BodyResult::Complete : BodyResult::Truncated;
            }
            size_t take = std::min(n, pending_.size());
            if (!sink(pending_.data(), take)) return BodyResult::Stopped;
            pending_.erase(0, take);
            if (n != std::string::npos) n -= take;
        }
        return BodyResult::Complete;
    }

    Connection& conn_;
    std::string pending_;
    bool chunked_ = false;
    bool has_length_ = false;
    size_t content_length_ = 0;
    bool read_failed_ = false;
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers)
        req += h.first + ": " + h.second + "\r\n";
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// Connects, sends the request, and reads the response head.
// Returns 0 (and logs) when no HTTP status could be obtained.
static long open_exchange(Connection& conn, ResponseReader& reader,
                          const std::string& url_str, const std::string& body,
                          const std::vector<Header>& headers, long timeout_secs) {
    auto url = parse_url(url_str);
    if (!url) {
        std::cerr << "[http] invalid URL: " << url_str << "\n";
        return 0;
    }
    if (!conn.connect(*url, timeout_secs)) {
        if (!conn.aborted())
            std::cerr << "[http] could not connect to " << url->host << ":" << url->port << "\n";
        return 0;
    }
    if (!conn.write_all(build_request(*url, body, headers))) return 0;
    return reader.read_head();
}

// Status 0, flagged when the deadline was the cause.
static HttpResponse no_response(const Connection& conn) {
    HttpResponse failed;
    failed.timed_out = conn.timed_out();
    return failed;
}

// The response to report for a 2xx body that ended early.
static HttpResponse cut_off(const Connection& conn, const std::string& url) {
    if (!conn.aborted())
        std::cerr << "[http] response body from " << url << " ended early\n";
    return no_response(conn);
}

// ── SocketHttpClient ───────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    Connection conn(nullptr);
    ResponseReader reader(conn);
    HttpResponse resp;
    resp.status_code = open_exchange(conn, reader, url, body, headers, timeout_seconds);
    if (resp.status_code == 0) return no_response(conn);
    BodyResult result = reader.read_body([&](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    });
    // A partial error body still carries its status
    if (result == BodyResult::Truncated && is_success_status(resp.status_code))
        return cut_off(conn, url);
    return resp;
}

HttpResponse SocketHttpClient::stream_post_raw(const std::string& url,
                                               const std::string& body,
                                               const std::vector<Header>& headers,
                                               RawChunkCallback callback,
                                               long timeout_seconds,
                                               const std::atomic<bool>* cancel) {
    Connection conn(cancel);
    ResponseReader reader(conn);
    HttpResponse resp;
    resp.status_code = open_exchange(conn, reader, url, body, headers, timeout_seconds);
    if (resp.status_code == 0) return no_response(conn);

    if (!is_success_status(resp.status_code)) {
        BodyResult result = reader.read_body([&](const char* data, size_t len) {
            resp.body.append(data, len);
            return true;
        });
        if (result == BodyResult::Truncated)
            std::cerr << "[http] error body from " << url << " ended early\n";
        return resp;
    }

    BodyResult result = reader.read_body([&](const char* data, size_t len) {
        return !conn.aborted() && callback(data, len);
    });
    // Cancelled by the caller: the exchange itself was fine
    if (result == BodyResult::Truncated && !(cancel && cancel->load()))
        return cut_off(conn, url);
    return resp;
}

} // namespace genai

#endif // __linux__
