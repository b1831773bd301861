#include "physio/vendor_library.hpp"
#include "physio/returncode.hpp"
#include <dlfcn.h>
#include <unistd.h>
#include <limits.h>
#include <iostream>
#include <vector>

using namespace Physio;

const char* VendorLibrary::DEFAULT_NAME = "libmpdev.so";
std::mutex VendorLibrary::mutex;
VendorLibrary* VendorLibrary::instance = nullptr;

static std::string executable_directory() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) return "";
    std::string exe(buf, len);
    size_t slash = exe.rfind('/');
    if (slash == std::string::npos) return "";
    return exe.substr(0, slash);
}

VendorLibrary::VendorLibrary(void* new_handle, std::string new_path) {
    handle = new_handle;
    path = new_path;
}

VendorLibrary::~VendorLibrary() {
    if (dlclose(handle) != 0) {
        std::cerr << "WARNING: closing \"" << path << "\" failed: " << dlerror() << "\n";
    }
}

int VendorLibrary::load(std::string path) {
    std::lock_guard<std::mutex> lck(mutex);
    if (instance != nullptr) {
        if (path.empty() || path == instance->path) return 0;
        std::cerr << "vendor library already bound to \"" << instance->path << "\"; refusing to load \"" << path << "\"\n";
        return 1;
    }

    std::vector<std::string> candidates;
    if (!path.empty()) {
        candidates.push_back(path);
    } else {
        candidates.push_back(DEFAULT_NAME);
        std::string dir = executable_directory();
        if (!dir.empty()) candidates.push_back(dir + "/" + DEFAULT_NAME);
    }

    void* handle = nullptr;
    std::string used;
    for (const auto& candidate : candidates) {
        handle = dlopen(candidate.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (handle != nullptr) {
            used = candidate;
            break;
        }
        std::cerr << "could not load \"" << candidate << "\": " << dlerror() << "\n";
    }
    if (handle == nullptr) {
        std::cerr << "could not load the mpdev library\n";
        return 2;
    }

    VendorLibrary* library = new VendorLibrary(handle, used);
    if (library->resolve() != 0) {
        delete library;
        return 3;
    }

    std::cout << "using mpdev library \"" << used << "\"\n";
    instance = library;
    return 0;
}

void VendorLibrary::unload() {
    std::lock_guard<std::mutex> lck(mutex);
    if (instance == nullptr) return;
    delete instance;
    instance = nullptr;
}

VendorLibrary* VendorLibrary::get() {
    std::lock_guard<std::mutex> lck(mutex);
    return instance;
}

template <typename T>
bool VendorLibrary::resolve_symbol(T& target, const char* name, bool required) {
    dlerror();
    void* symbol = dlsym(handle, name);
    if (symbol == nullptr) {
        if (required) {
            std::cerr << "\"" << path << "\" does not export " << name << "\n";
        }
        return false;
    }
    target = reinterpret_cast<T>(symbol);
    return true;
}

int VendorLibrary::resolve() {
    bool complete =
        resolve_symbol(connect_mp_dev, "connectMPDev", true) &
        resolve_symbol(disconnect_mp_dev, "disconnectMPDev", true) &
        resolve_symbol(set_sample_rate, "setSampleRate", true) &
        resolve_symbol(set_acq_channels, "setAcqChannels", true) &
        resolve_symbol(start_acquisition, "startAcquisition", true) &
        resolve_symbol(stop_acquisition, "stopAcquisition", true) &
        resolve_symbol(get_most_recent_sample, "getMostRecentSample", true);
    if (!complete) return 1;

    // older library releases come without buffered reads
    if (!resolve_symbol(get_mp_buffer, "getMPBuffer", false)) {
        std::cerr << "WARNING: \"" << path << "\" does not support buffered reads\n";
    }
    return 0;
}

std::string VendorLibrary::getPath() {
    return path;
}

bool VendorLibrary::hasBufferedRead() {
    return get_mp_buffer != nullptr;
}

int VendorLibrary::connectMPDev(int type, int comm, const char* serial) {
    return connect_mp_dev(type, comm, serial);
}

int VendorLibrary::disconnectMPDev() {
    return disconnect_mp_dev();
}

int VendorLibrary::setSampleRate(double interval_ms) {
    return set_sample_rate(interval_ms);
}

int VendorLibrary::setAcqChannels(int* mask) {
    return set_acq_channels(mask);
}

int VendorLibrary::startAcquisition() {
    return start_acquisition();
}

int VendorLibrary::stopAcquisition() {
    return stop_acquisition();
}

int VendorLibrary::getMostRecentSample(double* data) {
    return get_most_recent_sample(data);
}

int VendorLibrary::getMPBuffer(uint32_t frames, uint32_t* received, double* data) {
    if (get_mp_buffer == nullptr) return MPDRVERR;
    return get_mp_buffer(frames, received, data);
}
