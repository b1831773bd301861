#pragma once
#pragma GCC visibility push(default)

#include <string>
#include <mutex>
#include <stdint.h>

namespace Physio {

    // entry points of the vendor's mpdev library
    extern "C" {
        typedef int (*connect_mp_dev_t)(int type, int comm, const char* serial);
        typedef int (*disconnect_mp_dev_t)();
        typedef int (*set_sample_rate_t)(double interval_ms);
        typedef int (*set_acq_channels_t)(int* mask);
        typedef int (*start_acquisition_t)();
        typedef int (*stop_acquisition_t)();
        typedef int (*get_most_recent_sample_t)(double* data);
        typedef int (*get_mp_buffer_t)(uint32_t frames, uint32_t* received, double* data);
    }

    /*
     * Process-wide binding to the vendor library. The vendor API keeps its device
     * state in globals, so there is at most one binding per process. Without an
     * explicit path, DEFAULT_NAME is looked up through the dynamic loader search
     * path first, then in the directory of the running executable.
     */
    class VendorLibrary {
        public:
            static const char* DEFAULT_NAME;

            // 0 on success; loading the path that is already bound is a no-op
            static int load(std::string path = "");
            static void unload();
            // nullptr while no library is bound
            static VendorLibrary* get();

            std::string getPath();
            bool hasBufferedRead();

            int connectMPDev(int type, int comm, const char* serial);
            int disconnectMPDev();
            int setSampleRate(double interval_ms);
            int setAcqChannels(int* mask);
            int startAcquisition();
            int stopAcquisition();
            int getMostRecentSample(double* data);
            int getMPBuffer(uint32_t frames, uint32_t* received, double* data);
        private:
            VendorLibrary(void* handle, std::string path);
            ~VendorLibrary();

            static std::mutex mutex;
            static VendorLibrary* instance;

            void* handle;
            std::string path;

            connect_mp_dev_t connect_mp_dev = nullptr;
            disconnect_mp_dev_t disconnect_mp_dev = nullptr;
            set_sample_rate_t set_sample_rate = nullptr;
            set_acq_channels_t set_acq_channels = nullptr;
            start_acquisition_t start_acquisition = nullptr;
            stop_acquisition_t stop_acquisition = nullptr;
            get_most_recent_sample_t get_most_recent_sample = nullptr;
            get_mp_buffer_t get_mp_buffer = nullptr;

            int resolve();
            template <typename T>
            bool resolve_symbol(T& target, const char* name, bool required);
    };

}
