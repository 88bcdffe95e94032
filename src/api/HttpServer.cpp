#include "api/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace cfe::api {

namespace {

constexpr std::size_t kMaxHeaderBytes = 16U * 1024U;

std::string describeErrno(int err) {
    return std::strerror(err);
}

std::string formatAddress(const Endpoint& endpoint) {
    if (endpoint.address.empty()) {
        return std::string("0.0.0.0:") + std::to_string(endpoint.port);
    }
    return endpoint.address + ':' + std::to_string(endpoint.port);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Content-Length of the header block, 0 when absent. Returns false when the
// header is present but malformed.
bool parseContentLength(const std::string& headers, std::size_t& length) {
    length = 0;
    std::istringstream stream(headers);
    std::string line;
    std::getline(stream, line);  // request line
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (toLowerCopy(line.substr(0, colon)) != "content-length") {
            continue;
        }
        try {
            std::size_t consumed = 0;
            const auto value = line.substr(colon + 1);
            length = static_cast<std::size_t>(std::stoull(value, &consumed));
            return value.find_first_not_of(" \t", consumed) == std::string::npos;
        } catch (const std::exception&) {
            return false;
        }
    }
    return true;
}

}  // namespace

HttpServer::HttpServer(Endpoint endpoint, std::size_t threadCount)
    : endpoint_(std::move(endpoint)), threadCount_(threadCount ? threadCount : 1) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::setCorsConfig(CorsConfig config) { corsConfig_ = std::move(config); }

void HttpServer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    serverFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        running_.store(false);
        throw std::runtime_error("Unable to create server socket: " + describeErrno(errno));
    }

    int opt = 1;
    ::setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint_.port);
    if (endpoint_.address.empty() || endpoint_.address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (::inet_pton(AF_INET, endpoint_.address.c_str(), &addr.sin_addr) != 1) {
            ::close(serverFd_);
            serverFd_ = -1;
            running_.store(false);
            throw std::runtime_error("Invalid listen address: " + endpoint_.address);
        }
    }

    if (::bind(serverFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Unable to bind " + formatAddress(endpoint_) + ": " + message);
    }

    if (::listen(serverFd_, SOMAXCONN) < 0) {
        const auto message = describeErrno(errno);
        ::close(serverFd_);
        serverFd_ = -1;
        running_.store(false);
        throw std::runtime_error("Unable to listen: " + message);
    }

    LOG_INFO("HTTP server listening on " << formatAddress(endpoint_) << " with " << threadCount_ << " workers");

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (serverFd_ >= 0) {
        ::shutdown(serverFd_, SHUT_RDWR);
        ::close(serverFd_);
        serverFd_ = -1;
    }

    wait();
}

void HttpServer::wait() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void HttpServer::workerLoop(std::size_t workerId) {
    LOG_DEBUG("Worker " << workerId << " started");

    while (running_.load()) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = ::accept(serverFd_, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);
        if (clientFd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EBADF || errno == EINVAL) {
                break;
            }
            LOG_WARN("accept() failed: " << describeErrno(errno));
            continue;
        }

        handleClient(clientFd);
    }

    LOG_DEBUG("Worker " << workerId << " stopped");
}

std::optional<Request> HttpServer::readRequest(int clientFd, bool& tooLarge) const {
    tooLarge = false;
    std::string raw;
    raw.reserve(1024);
    char buffer[4096];

    std::size_t headerEnd = std::string::npos;
    while ((headerEnd = raw.find("\r\n\r\n")) == std::string::npos) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            return std::nullopt;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes));
        if (raw.size() > kMaxHeaderBytes) {
            tooLarge = true;
            return std::nullopt;
        }
    }

    const auto headers = raw.substr(0, headerEnd);
    std::size_t contentLength = 0;
    if (!parseContentLength(headers, contentLength)) {
        return std::nullopt;
    }
    if (contentLength > kMaxRequestBytes) {
        tooLarge = true;
        return std::nullopt;
    }

    const auto bodyStart = headerEnd + 4;
    while (raw.size() < bodyStart + contentLength) {
        const auto bytes = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            return std::nullopt;
        }
        raw.append(buffer, static_cast<std::size_t>(bytes));
    }

    std::istringstream requestStream(headers);
    std::string requestLine;
    std::getline(requestStream, requestLine);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    Request request{};
    std::istringstream lineStream(requestLine);
    lineStream >> request.method >> request.target >> request.version;
    if (request.method.empty() || request.target.empty()) {
        return std::nullopt;
    }

    const auto queryPos = request.target.find('?');
    if (queryPos != std::string::npos) {
        request.path = request.target.substr(0, queryPos);
        request.query = request.target.substr(queryPos + 1);
    } else {
        request.path = request.target;
    }
    request.body = raw.substr(bodyStart, contentLength);
    return request;
}

void HttpServer::writeResponse(int clientFd, const Response& responseData) const {
    std::ostringstream response;
    response << "HTTP/1.1 " << responseData.statusCode << ' ' << responseData.statusText << "\r\n";
    const std::string contentType = responseData.contentType.empty() ? "application/json" : responseData.contentType;
    response << "Content-Type: " << contentType << "\r\n";
    for (const auto& header : responseData.headers) {
        if (!header.first.empty()) {
            response << header.first << ": " << header.second << "\r\n";
        }
    }
    if (corsConfig_.enabled && !corsConfig_.origin.empty()) {
        response << "Access-Control-Allow-Origin: " << corsConfig_.origin << "\r\n";
        response << "Vary: Origin\r\n";
        response << "Access-Control-Allow-Headers: Content-Type\r\n";
        response << "Access-Control-Allow-Methods: GET, POST, DELETE, OPTIONS\r\n";
    }
    response << "Content-Length: " << responseData.body.size() << "\r\n";
    response << "Connection: close\r\n\r\n";
    response << responseData.body;

    const auto responseStr = response.str();
    const char* data = responseStr.data();
    std::size_t remaining = responseStr.size();

    while (remaining > 0) {
        const auto written = ::send(clientFd, data, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            break;
        }
        remaining -= static_cast<std::size_t>(written);
        data += written;
    }
}

void HttpServer::handleClient(int clientFd) {
    bool tooLarge = false;
    const auto request = readRequest(clientFd, tooLarge);

    if (!request) {
        Response rejected{};
        if (tooLarge) {
            cfe::http::json_error(rejected, 413, cfe::http::errors::payload_too_large);
        } else {
            cfe::http::json_error(rejected, 400, cfe::http::errors::request_invalid);
        }
        writeResponse(clientFd, rejected);
    } else if (request->method == "OPTIONS" && corsConfig_.enabled) {
        writeResponse(clientFd, Response{204, cfe::http::status_reason(204), {}, {}, {}});
    } else {
        writeResponse(clientFd, router_.handle(*request));
    }

    ::shutdown(clientFd, SHUT_RDWR);
    ::close(clientFd);
}

}  // namespace cfe::api
