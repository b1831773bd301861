#pragma once
#pragma GCC visibility push(default)

#include <string>
#include <vector>

namespace Physio {

    class DeviceType {
        public:
            // accepts MP150, MP160 and MP36R in any case; nullptr for anything else
            static DeviceType* parse(std::string input);
            static std::string supported();
            std::string getName();
            int getCode();
        private:
            DeviceType(std::string name, int code);
            std::string name;
            int code;
    };

    class CommunicationType {
        public:
            static const int USB = 10;
            static const int UDP = 11;
            // "usb" or "udp"; -1 for anything else
            static int parse(std::string input);
    };

    class ChannelSpec {
        public:
            static const int MAX_CHANNELS = 16;

            /*
             * Either a channel count ("3" selects channels 0 to 2) or a comma separated
             * list of channel indices ("0,2,5"). Returns nullptr if the input selects no
             * channel, names a channel twice or names one outside 0 to 15.
             */
            static ChannelSpec* parse(std::string input);

            ChannelSpec(int count);
            // entries are 0 or 1, one per hardware channel
            int* getMask();
            int getCount();
            std::vector<int> getChannels();
        private:
            ChannelSpec();
            int mask[MAX_CHANNELS];
    };

    // the vendor expects the sample interval in milliseconds rather than a rate
    double sample_interval_ms(double rate_hz);

}
