#pragma once
#pragma GCC visibility push(default)

#include "physio/device.hpp"
#include "physio/mpdevice.hpp"
#include "physio/recorder.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <functional>
#include <stdint.h>

namespace Physio {

    typedef struct {
        DeviceType* type;
        int comm;
        std::string serial;
        double sample_rate;
        ChannelSpec* channels;
        std::string logfile;
        bool overwrite;
    } session_params;

    class Session {
        public:
            Session(MpDevice* device);
            ~Session();

            /*
             * Connects, configures the sample rate and channels, starts the acquisition
             * and opens the log file. Returns the vendor code of the first failing step
             * (the device is disconnected again in that case), or -1 if the log file
             * cannot be opened.
             */
            int open(session_params params);
            // one call to the vendor; samples equal to the previous one are not treated as new
            int poll();
            // stops recording, closes the log file and disconnects; returns the disconnect result
            int close();

            void start_recording();
            // flushes the log file to disk; 0 on success
            int stop_recording();
            // clears the buffer; returns MPINVPARA for a channel that is not being acquired
            int start_recording_to_buffer(int channel = 0);
            void stop_recording_to_buffer();

            std::vector<double> sample();
            std::vector<double> get_buffer();
            int log(std::string message);
            // milliseconds since the connection was opened
            int64_t get_timestamp();

            bool is_open();
            bool is_recording();
            bool is_recording_to_buffer();
            std::string getLogFilename();
            void set_sample_callback(std::function<void(const std::vector<double>&)> callback);
        private:
            MpDevice* device;
            std::function<void(const std::vector<double>&)> sample_callback;

            // guards everything below; control requests arrive on another thread
            std::mutex mutex;
            Recorder* recorder = nullptr;
            std::chrono::steady_clock::time_point starting_time;
            std::vector<double> newest_sample;
            std::vector<double> buffer;
            int buffer_channel = 0;
            bool recording = false;
            bool recording_to_buffer = false;

            void abort_open();
    };

}
