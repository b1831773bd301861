#include "physio/session.hpp"
#include "physio/returncode.hpp"
#include <iostream>

using namespace Physio;

Session::Session(MpDevice* new_device) {
    device = new_device;
}

Session::~Session() {
    if (device->is_connected()) {
        int r = close();
        if (r != MPSUCCESS) {
            std::cerr << "WARNING: closing the session failed: " << describe(r) << "\n";
        }
    }
    delete recorder;
}

int Session::open(session_params params) {
    if (params.type == nullptr || params.channels == nullptr) return MPINVPARA;

    int r = device->connect(params.type, params.comm, params.serial);
    if (r != MPSUCCESS) {
        std::cerr << "failed to connect to the device: " << describe(r) << "\n";
        return r;
    }

    {
        std::lock_guard<std::mutex> lck(mutex);
        starting_time = std::chrono::steady_clock::now();
    }

    r = device->set_sample_rate(params.sample_rate);
    if (r != MPSUCCESS) {
        std::cerr << "failed to set samplerate: " << describe(r) << "\n";
        abort_open();
        return r;
    }

    r = device->set_channels(params.channels);
    if (r != MPSUCCESS) {
        std::cerr << "failed to set channels to acquire: " << describe(r) << "\n";
        abort_open();
        return r;
    }

    r = device->start_acquisition();
    if (r != MPSUCCESS) {
        std::cerr << "failed to start acquisition: " << describe(r) << "\n";
        abort_open();
        return r;
    }

    std::lock_guard<std::mutex> lck(mutex);
    // log and recording requests reach the recorder from the control thread
    delete recorder;
    recorder = new Recorder(Recorder::resolve_filename(params.logfile, params.overwrite), params.channels->getChannels());
    if (recorder->open() != 0) {
        abort_open();
        return -1;
    }
    std::cout << "logging to \"" << recorder->getFilename() << "\"\n";

    newest_sample.assign(params.channels->getCount(), 0.0);
    buffer.clear();
    recording = false;
    recording_to_buffer = false;
    return MPSUCCESS;
}

void Session::abort_open() {
    int r = device->disconnect();
    if (r != MPSUCCESS) {
        std::cerr << "WARNING: disconnecting failed: " << describe(r) << "\n";
    }
}

int Session::poll() {
    std::vector<double> data;
    int r = device->get_most_recent_sample(data);
    if (r != MPSUCCESS) return r;
    int64_t t = get_timestamp();

    {
        std::lock_guard<std::mutex> lck(mutex);
        if (data == newest_sample) return r;
        newest_sample = data;

        if (recording && recorder->write_sample(t, data) != 0) {
            std::cerr << "ERROR: writing to the log file failed, recording stopped\n";
            recording = false;
        }
        if (recording_to_buffer && buffer_channel < (int) data.size()) {
            buffer.push_back(data[buffer_channel]);
        }
    }

    if (sample_callback) sample_callback(data);
    return r;
}

int Session::close() {
    {
        std::lock_guard<std::mutex> lck(mutex);
        if (recording) {
            recording = false;
            if (recorder == nullptr || recorder->flush() != 0) {
                std::cerr << "WARNING: log file may be incomplete\n";
            }
        }
        if (recorder != nullptr && recorder->close() != 0) {
            std::cerr << "WARNING: closing the log file failed\n";
        }
    }

    int r = device->disconnect();
    if (r != MPSUCCESS) {
        std::cerr << "failed to close the connection to the device: " << describe(r) << "\n";
    }
    return r;
}

void Session::start_recording() {
    std::lock_guard<std::mutex> lck(mutex);
    recording = true;
}

int Session::stop_recording() {
    std::lock_guard<std::mutex> lck(mutex);
    recording = false;
    if (recorder == nullptr) return 1;
    return recorder->flush();
}

int Session::start_recording_to_buffer(int channel) {
    std::lock_guard<std::mutex> lck(mutex);
    if (channel < 0 || channel >= (int) newest_sample.size()) return MPINVPARA;
    buffer.clear();
    buffer_channel = channel;
    recording_to_buffer = true;
    return MPSUCCESS;
}

void Session::stop_recording_to_buffer() {
    std::lock_guard<std::mutex> lck(mutex);
    recording_to_buffer = false;
}

std::vector<double> Session::sample() {
    std::lock_guard<std::mutex> lck(mutex);
    return newest_sample;
}

std::vector<double> Session::get_buffer() {
    std::lock_guard<std::mutex> lck(mutex);
    return buffer;
}

int Session::log(std::string message) {
    int64_t t = get_timestamp();
    std::lock_guard<std::mutex> lck(mutex);
    if (recorder == nullptr) return 1;
    return recorder->write_message(t, message);
}

int64_t Session::get_timestamp() {
    std::lock_guard<std::mutex> lck(mutex);
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - starting_time).count();
}

bool Session::is_open() {
    return device->is_connected();
}

bool Session::is_recording() {
    std::lock_guard<std::mutex> lck(mutex);
    return recording;
}

bool Session::is_recording_to_buffer() {
    std::lock_guard<std::mutex> lck(mutex);
    return recording_to_buffer;
}

std::string Session::getLogFilename() {
    std::lock_guard<std::mutex> lck(mutex);
    if (recorder == nullptr) return "";
    return recorder->getFilename();
}

void Session::set_sample_callback(std::function<void(const std::vector<double>&)> callback) {
    sample_callback = callback;
}
