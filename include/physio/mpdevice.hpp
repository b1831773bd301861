#pragma once
#pragma GCC visibility push(default)

#include "physio/device.hpp"
#include <string>
#include <vector>
#include <stdint.h>

namespace Physio {

    /*
     * Call-through wrapper around the bound vendor library. Every method returns the
     * vendor return code unchanged; conditions caught before calling into the
     * library are reported with the vendor's own codes (MPDRVERR while no library
     * is bound, MPNOTCON before connect, MPINVPARA for bad arguments).
     */
    class MpDevice {
        public:
            MpDevice() = default;
            virtual ~MpDevice() = default;

            // serial "auto" connects to the first device that responds
            virtual int connect(DeviceType* type, int comm, std::string serial);
            virtual int set_sample_rate(double rate_hz);
            virtual int set_channels(ChannelSpec* channels);
            virtual int start_acquisition();
            // blocks inside the vendor library until a new sample is available
            virtual int get_most_recent_sample(std::vector<double>& sample);
            // drains up to frames frames; samples receives frames x channel count values
            virtual int read_buffer(uint32_t frames, std::vector<double>& samples);
            virtual int stop_acquisition();
            // stops a running acquisition first
            virtual int disconnect();

            bool is_connected();
            bool is_acquiring();
            int get_channel_count();
        private:
            bool connected = false;
            bool acquiring = false;
            int channel_count = 0;
    };

}
