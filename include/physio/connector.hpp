#pragma once
#pragma GCC visibility push(default)

#include <string>
#include <sstream>
#include <getopt.h>
#include <vector>
#include <map>
#include <stdint.h>
#include <mutex>
#include <csdr/ringbuffer.hpp>

namespace Physio {

    class Connector {
        public:
            Connector() = default;
            virtual ~Connector() = default;
            int main(int argc, char** argv);
            void handle_signal(int signal);

            virtual void applyChange(std::string key, std::string value);

            static std::map<std::string, std::string> parseSettings(std::string input);
            static bool convertBooleanValue(std::string input);
        protected:
            char* device_id = nullptr;
            bool run = true;
            std::mutex devMutex;

            // interleaved float frames, read by every sample socket client
            Csdr::Ringbuffer<float>* float_buffer = nullptr;

            void init_buffers();
            // channel values of one frame, interleaved into the output buffer
            void processSamples(const double* input, uint32_t len);

            // methods that come with a reasonable default behaviour, but can be overridden
            virtual int parse_arguments(int argc, char** argv);
            virtual std::stringstream get_usage_string();
            virtual std::vector<struct option> getopt_long_options();
            virtual int receive_option(int c, char* optarg);
            virtual void print_version();
            virtual int setup();
            virtual int stop();

            virtual double get_sample_rate();

            // methods that must be overridden for the individual hardware
            virtual uint32_t get_buffer_size() = 0;
            virtual int open() = 0;
            virtual int read() = 0;
            virtual int close() = 0;
            virtual int set_sample_rate(double sample_rate) = 0;
        private:
            char* program_name;
            uint16_t port = 4950;
            int32_t control_port = -1;
            double sample_rate = 200;

            void print_usage();

            void convert(const double* input, float* output, uint32_t len);
    };
}
