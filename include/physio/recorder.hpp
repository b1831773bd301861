#pragma once
#pragma GCC visibility push(default)

#include <string>
#include <vector>
#include <mutex>
#include <cstdio>
#include <stdint.h>

namespace Physio {

    /*
     * Tab separated sample log. The header names the timestamp and one column per
     * hardware channel ("channel_<index>"); every following row starts on a new line and holds either a sample
     * ("<ms>\t<v0>\t...") or a message ("MSG\t<ms>\t<text>").
     */
    class Recorder {
        public:
            static const char* SUFFIX;

            // <base>_BIOPAC_data.tsv, or <base>_<i>_BIOPAC_data.tsv with the first free i >= 2
            static std::string resolve_filename(std::string base, bool overwrite);

            Recorder(std::string filename, std::vector<int> channels);
            ~Recorder();

            // 0 on success
            int open();
            bool is_open();
            std::string getFilename();

            int write_sample(int64_t timestamp, const std::vector<double>& sample);
            int write_message(int64_t timestamp, std::string message);
            // pushes everything written so far to disk
            int flush();
            int close();
        private:
            std::string filename;
            std::vector<int> channels;
            FILE* file = nullptr;
            std::mutex mutex;
    };

}
