#include "control_connection.hpp"
#include <cstring>
#include <cerrno>
#include <string>
#include <iostream>
#include <unistd.h>

using namespace Physio;

ControlSocket::ControlSocket(Connector* new_connector, uint16_t port) {
    connector = new_connector;

    struct sockaddr_in local;
    const char* addr = "127.0.0.1";

    std::cout << "setting up control socket...\n";

    std::memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_port = htons(port);
    local.sin_addr.s_addr = inet_addr(addr);

    sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    int reuse = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(int));
    if (bind(sock, (struct sockaddr *)&local, sizeof(local)) < 0) {
        std::cerr << "WARNING: could not bind control socket to port " << port << ": " << std::strerror(errno) << "\n";
    }
    listen(sock, 1);

    std::cout << "control socket started on " << port << "\n";

    thread = std::thread([this] { loop(); });
}

void ControlSocket::loop() {
    struct sockaddr_in remote;
    ssize_t read_bytes;

    while (run) {
        socklen_t rlen = sizeof(remote);
        int control_sock = accept(sock, (struct sockaddr *)&remote, &rlen);
        if (control_sock < 0) continue;
        std::cout << "control connection established\n";

        bool connected = true;
        uint8_t buf[256];
        // a line may be split across several reads
        std::string pending;

        while (connected) {
            read_bytes = recv(control_sock, &buf, 256, 0);
            if (read_bytes <= 0) {
                connected = false;
            } else {
                pending += std::string(reinterpret_cast<char const*>(&buf), read_bytes);
                size_t newline_pos;
                while ((newline_pos = pending.find('\n')) != std::string::npos) {
                    std::string line = pending.substr(0, newline_pos);
                    pending = pending.substr(newline_pos + 1);
                    handle_line(line);
                }
            }
        }
        ::close(control_sock);
        std::cout << "control connection ended\n";
    }
}

void ControlSocket::handle_line(const std::string& line) {
    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
        std::cerr << "invalid message: \"" << line << "\"\n";
        return;
    }

    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);
    if (!value.empty() && value[value.size() - 1] == '\r') {
        value = value.substr(0, value.size() - 1);
    }

    connector->applyChange(key, value);
}
