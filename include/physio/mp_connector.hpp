#pragma once
#pragma GCC visibility push(default)

#include "physio/connector.hpp"
#include "physio/device.hpp"
#include "physio/mpdevice.hpp"
#include "physio/session.hpp"
#include <string>

// frames of up to 16 channels; the output buffer holds ten times as much
#define PHYSIO_MP_BUFFER_SIZE 16 * 1024

namespace Physio {

    class MpConnector: public Connector {
        public:
            MpConnector();
            ~MpConnector() override;
            void applyChange(std::string key, std::string value) override;
        protected:
            std::stringstream get_usage_string() override;
            std::vector<struct option> getopt_long_options() override;
            int receive_option(int c, char* optarg) override;
            void print_version() override;
            uint32_t get_buffer_size() override;
            int open() override;
            int setup() override;
            int read() override;
            int close() override;
            int set_sample_rate(double sample_rate) override;

            MpDevice* device;
            Session* session;

            // applies a sample rate received through the control socket; the vendor only accepts it while idle
            int apply_pending_sample_rate();
        private:
            uint32_t mp_buffer_size = PHYSIO_MP_BUFFER_SIZE;
            std::string library_path = "";
            DeviceType* type;
            int comm = CommunicationType::UDP;
            ChannelSpec* channels;
            std::string logfile = "default";
            bool overwrite = false;
            bool record = false;

            // sample rate changes are applied from the read loop, between two polls
            double pending_sample_rate = 0;

            void dump_buffer();
    };

}
