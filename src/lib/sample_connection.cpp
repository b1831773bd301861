#include "sample_connection.hpp"

#include <cstring>
#include <unistd.h>
#include <cerrno>
#include <iostream>

using namespace Physio;

SampleSocket::SampleSocket(uint16_t port, Csdr::Ringbuffer<float>* new_ringbuffer) {
    ringbuffer = new_ringbuffer;

    struct sockaddr_in local;
    const char* addr = "127.0.0.1";

    std::memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_port = htons(port);
    local.sin_addr.s_addr = inet_addr(addr);

    sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    int reuse = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(int));
    if (bind(sock, (struct sockaddr *)&local, sizeof(local)) < 0) {
        std::cerr << "WARNING: could not bind sample socket to port " << port << ": " << std::strerror(errno) << std::endl;
    }

    std::cout << "socket setup complete, waiting for connections" << std::endl;

    listen(sock, 1);
}

void SampleSocket::start() {
    thread = std::thread( [this] { accept_loop(); });
}

void SampleSocket::accept_loop() {
    struct sockaddr_in remote;
    socklen_t rlen = sizeof(remote);

    while (run) {
        int client_sock = accept(sock, (struct sockaddr *)&remote, &rlen);

        if (client_sock >= 0) {
            new SampleConnection(client_sock, new Csdr::RingbufferReader<float>(ringbuffer));
        }
    }
}

SampleConnection::SampleConnection(int client_sock, Csdr::RingbufferReader<float>* reader) {
    sock = client_sock;
    this->reader = reader;
    thread = std::thread( [this] {
        loop();
        delete this->reader;
        delete this;
    });
    thread.detach();
}

void SampleConnection::loop() {
    std::cout << "client connection established" << std::endl;

    ssize_t sent;

    while (run) {
        reader->wait();
        size_t available;
        while ((available = reader->available()) > 0) {
            sent = send(sock, reader->getReadPointer(), available * sizeof(float), MSG_NOSIGNAL);
            reader->advance(available);
            if (sent <= 0) {
                run = false;
                break;
            }
        }
    }
    std::cout << "closing client socket" << std::endl;
    close(sock);
}
