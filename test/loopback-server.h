#ifndef LOOPBACK_SERVER_H
#define LOOPBACK_SERVER_H

#include <arpa/inet.h>
#include <atomic>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

// Minimal HTTP/1.1 server on 127.0.0.1 serving one body for every path.
// Each connection carries one request and is closed after the response.
class LoopbackServer {
public:
    std::string body;
    bool advertiseRanges = true; // send "Accept-Ranges: bytes"
    bool honourRanges = true;    // answer Range requests with 206, else always 200
    int delayMs = 0;             // wait before sending a GET body

    explicit LoopbackServer(const std::string& content) : body(content) {}

    ~LoopbackServer() { stop(); }

    // binds an ephemeral port, returns false when the socket cannot be set up
    bool start() {
        serverSocket = socket(AF_INET, SOCK_STREAM, 0);
        if (serverSocket < 0) return false;
        int reuse = 1;
        setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (bind(serverSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            listen(serverSocket, 16) != 0 ||
            getsockname(serverSocket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            close(serverSocket);
            serverSocket = -1;
            return false;
        }
        port = ntohs(addr.sin_port);
        running = true;
        acceptor = std::thread([this]() { acceptLoop(); });
        return true;
    }

    void stop() {
        if (!running.exchange(false)) return;
        shutdown(serverSocket, SHUT_RDWR); // wakes up accept()
        close(serverSocket);
        if (acceptor.joinable()) acceptor.join();
        for (auto& th : handlers) {
            if (th.joinable()) th.join();
        }
        handlers.clear();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

private:
    int serverSocket = -1;
    int port = 0;
    std::atomic<bool> running{false};
    std::thread acceptor;
    std::vector<std::thread> handlers;

    void acceptLoop() {
        while (running) {
            int client = accept(serverSocket, nullptr, nullptr);
            if (client < 0) {
                if (!running) break;
                continue;
            }
            handlers.emplace_back([this, client]() { handleClient(client); });
        }
    }

    static bool sendAll(int client, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(client, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    // first and last byte of "Range: bytes=a-b", false when the request has none
    static bool parseRange(const std::string& request, size_t size, size_t& first, size_t& last) {
        std::string lowered(request);
        for (auto& ch : lowered) ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
        size_t pos = lowered.find("\r\nrange: bytes=");
        if (pos == std::string::npos) return false;
        pos += 15;
        char* endp = nullptr;
        first = std::strtoull(request.c_str() + pos, &endp, 10);
        last = size - 1;
        if (*endp == '-' && std::isdigit(static_cast<unsigned char>(endp[1]))) {
            last = std::strtoull(endp + 1, nullptr, 10);
        }
        if (last >= size) last = size - 1;
        return first <= last;
    }

    void handleClient(int client) {
        std::string request;
        char buffer[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            request.append(buffer, static_cast<size_t>(n));
        }
        bool head = request.compare(0, 5, "HEAD ") == 0;

        size_t first = 0, last = body.empty() ? 0 : body.size() - 1;
        bool partial = !head && honourRanges && !body.empty() && parseRange(request, body.size(), first, last);
        std::string payload = body.empty() ? "" : body.substr(first, last - first + 1);

        std::string response = partial ? "HTTP/1.1 206 Partial Content\r\n" : "HTTP/1.1 200 OK\r\n";
        response += "Content-Type: application/octet-stream\r\n";
        response += "Content-Length: " + std::to_string(payload.size()) + "\r\n";
        if (partial) {
            response += "Content-Range: bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" +
                        std::to_string(body.size()) + "\r\n";
        }
        if (advertiseRanges) response += "Accept-Ranges: bytes\r\n";
        response += "Connection: close\r\n\r\n";

        if (sendAll(client, response) && !head) {
            if (delayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
            sendAll(client, payload);
        }
        close(client);
    }
};

#endif // LOOPBACK_SERVER_H
