#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <stdint.h>
#include <thread>
#include <csdr/ringbuffer.hpp>

namespace Physio {

    // streams interleaved float frames to every client connected on the loopback port
    class SampleSocket {
        public:
            SampleSocket(uint16_t port, Csdr::Ringbuffer<float>* ringbuffer);
            void start();
        private:
            Csdr::Ringbuffer<float>* ringbuffer;
            int sock;
            std::thread thread;
            bool run = true;

            void accept_loop();
    };

    class SampleConnection {
        public:
            SampleConnection(int client_sock, Csdr::RingbufferReader<float>* reader);
        private:
            int sock;
            std::thread thread;
            bool run = true;
            Csdr::RingbufferReader<float>* reader;

            void loop();
    };

}
