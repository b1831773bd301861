#pragma once

#include "physio/connector.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <thread>
#include <stdint.h>

namespace Physio {

    class ControlSocket {
        public:
            ControlSocket(Connector* connector, uint16_t port);
        private:
            Connector* connector;
            int sock;
            bool run = true;
            std::thread thread;

            void loop();
            void handle_line(const std::string& line);
    };

}
