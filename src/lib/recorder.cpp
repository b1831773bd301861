#include "physio/recorder.hpp"
#include <iostream>
#include <sstream>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>

using namespace Physio;

const char* Recorder::SUFFIX = "_BIOPAC_data.tsv";

static bool file_exists(const std::string& name) {
    struct stat st;
    return stat(name.c_str(), &st) == 0;
}

std::string Recorder::resolve_filename(std::string base, bool overwrite) {
    std::string name = base + SUFFIX;
    if (overwrite) return name;
    for (int i = 2; file_exists(name); i++) {
        name = base + "_" + std::to_string(i) + SUFFIX;
    }
    return name;
}

Recorder::Recorder(std::string new_filename, std::vector<int> new_channels) {
    filename = new_filename;
    channels = new_channels;
}

Recorder::~Recorder() {
    close();
}

int Recorder::open() {
    std::lock_guard<std::mutex> lck(mutex);
    if (file != nullptr) return 0;

    file = fopen(filename.c_str(), "w");
    if (file == nullptr) {
        std::cerr << "could not open log file \"" << filename << "\": " << std::strerror(errno) << "\n";
        return 1;
    }

    std::stringstream header;
    header << "timestamp";
    for (size_t i = 0; i < channels.size(); i++) {
        header << "\tchannel_" << channels[i];
    }
    std::string s = header.str();
    if (fwrite(s.data(), 1, s.size(), file) != s.size()) {
        std::cerr << "writing log file header failed\n";
        return 2;
    }
    return 0;
}

bool Recorder::is_open() {
    std::lock_guard<std::mutex> lck(mutex);
    return file != nullptr;
}

std::string Recorder::getFilename() {
    return filename;
}

int Recorder::write_sample(int64_t timestamp, const std::vector<double>& sample) {
    std::stringstream row;
    row.precision(10);
    row << "\n" << timestamp;
    for (size_t i = 0; i < sample.size(); i++) {
        row << "\t" << sample[i];
    }
    std::string s = row.str();

    std::lock_guard<std::mutex> lck(mutex);
    if (file == nullptr) return 1;
    if (fwrite(s.data(), 1, s.size(), file) != s.size()) {
        std::cerr << "WARNING: writing sample to \"" << filename << "\" failed\n";
        return 2;
    }
    return 0;
}

int Recorder::write_message(int64_t timestamp, std::string message) {
    std::stringstream row;
    row << "\nMSG\t" << timestamp << "\t" << message;
    std::string s = row.str();

    std::lock_guard<std::mutex> lck(mutex);
    if (file == nullptr) return 1;
    if (fwrite(s.data(), 1, s.size(), file) != s.size()) {
        std::cerr << "WARNING: writing message to \"" << filename << "\" failed\n";
        return 2;
    }
    return 0;
}

int Recorder::flush() {
    std::lock_guard<std::mutex> lck(mutex);
    if (file == nullptr) return 1;
    if (fflush(file) != 0 || fsync(fileno(file)) != 0) {
        std::cerr << "WARNING: flushing \"" << filename << "\" failed: " << std::strerror(errno) << "\n";
        return 2;
    }
    return 0;
}

int Recorder::close() {
    std::lock_guard<std::mutex> lck(mutex);
    if (file == nullptr) return 0;
    int r = fclose(file);
    file = nullptr;
    if (r != 0) {
        std::cerr << "WARNING: closing \"" << filename << "\" failed\n";
        return 1;
    }
    return 0;
}
