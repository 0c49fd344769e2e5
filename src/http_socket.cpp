// HTTP/HTTPS POST over POSIX sockets + OpenSSL. Requests are sent with
// "Connection: close", so the full response is read to EOF and then parsed.
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
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace lookbook {

namespace {

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // path + query
};

bool parse_endpoint(const std::string& url, Endpoint& out) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return false;
    out.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t slash = url.find('/', host_start);
    std::string authority = url.substr(host_start, slash == std::string::npos
                                                       ? std::string::npos
                                                       : slash - host_start);
    out.target = (slash == std::string::npos) ? "/" : url.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = out.tls ? "443" : "80";
    }
    return !out.host.empty();
}

// RAII TCP socket with optional TLS session
class Socket {
public:
    Socket() = default;
    ~Socket() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool open(const Endpoint& ep, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res) != 0)
            return false;

        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_timeout(fd, ai, timeout_secs)) {
                fd_ = fd;
            } else {
                ::close(fd);
            }
        }
        freeaddrinfo(res);
        if (fd_ < 0) return false;

        struct timeval tv{timeout_secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (!ep.tls) return true;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, ep.host.c_str());
        return SSL_connect(ssl_) == 1;
    }

    bool send_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n = ssl_ ? SSL_write(ssl_, p, static_cast<int>(left))
                             : ::send(fd_, p, left, MSG_NOSIGNAL);
            if (n <= 0) {
                if (!ssl_ && n < 0 && errno == EINTR) continue;
                return false;
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

    // Read until the peer closes. Returns false on a read error or timeout.
    bool receive_all(std::string& out) {
        char buf[8192];
        for (;;) {
            ssize_t n = ssl_ ? SSL_read(ssl_, buf, sizeof(buf))
                             : ::recv(fd_, buf, sizeof(buf), 0);
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) return true;
            if (ssl_) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return true;
                // Some servers close without close_notify once the body is sent
                if (err == SSL_ERROR_SYSCALL && errno == 0) return true;
                return false;
            }
            if (errno == EINTR) continue;
            return false;
        }
    }

private:
    static bool connect_with_timeout(int fd, const struct addrinfo* ai, long timeout_secs) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno != EINPROGRESS) return false;
        if (rc != 0) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd, &wset);
            struct timeval tv{timeout_secs, 0};
            if (select(fd + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;
            int err = 0;
            socklen_t len = sizeof(err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
            if (err != 0) return false;
        }
        fcntl(fd, F_SETFL, flags);
        return true;
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

std::string decode_chunked(const std::string& raw) {
    std::string body;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) break;
        size_t chunk = std::strtoul(raw.c_str() + pos, nullptr, 16);
        if (chunk == 0) break;
        pos = eol + 2;
        body.append(raw, pos, std::min(chunk, raw.size() - pos));
        pos += chunk + 2;
    }
    return body;
}

HttpResponse parse_response(const std::string& raw) {
    HttpResponse resp;
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return resp;

    std::string head = raw.substr(0, head_end);
    size_t line_end = head.find("\r\n");
    std::string status_line = head.substr(0, line_end);
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos) return resp;
    long status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);

    bool chunked = false;
    size_t pos = (line_end == std::string::npos) ? head.size() : line_end + 2;
    while (pos < head.size()) {
        size_t next = head.find("\r\n", pos);
        std::string line = head.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        pos = (next == std::string::npos) ? head.size() : next + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = line.substr(0, colon);
        for (auto& c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        if (name == "transfer-encoding" &&
            line.find("chunked", colon) != std::string::npos) {
            chunked = true;
        }
    }

    std::string body = raw.substr(head_end + 4);
    resp.status_code = status;
    resp.body = chunked ? decode_chunked(body) : std::move(body);
    return resp;
}

} // namespace

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    Endpoint ep;
    if (!parse_endpoint(url, ep)) {
        std::cerr << "[http] Invalid URL: " << url << "\n";
        return {};
    }

    Socket sock;
    if (!sock.open(ep, timeout_seconds)) {
        std::cerr << "[http] Connection failed: " << ep.host << ":" << ep.port << "\n";
        return {};
    }

    std::string req;
    req.reserve(256 + body.size());
    req += "POST " + ep.target + " HTTP/1.1\r\n";
    req += "Host: " + ep.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;

    if (!sock.send_all(req)) return {};

    std::string raw;
    if (!sock.receive_all(raw) && raw.empty()) return {};
    return parse_response(raw);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

} // namespace lookbook
