#include "physio/mpdevice.hpp"
#include "physio/vendor_library.hpp"
#include "physio/returncode.hpp"
#include <iostream>
#include <stdint.h>

using namespace Physio;

int MpDevice::connect(DeviceType* type, int comm, std::string serial) {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (type == nullptr || (comm != CommunicationType::USB && comm != CommunicationType::UDP)) return MPINVPARA;

    if (serial.empty()) serial = "auto";
    std::cout << "connecting to " << type->getName() << " (serial: " << serial << ")\n";
    int r = library->connectMPDev(type->getCode(), comm, serial.c_str());
    connected = r == MPSUCCESS;
    return r;
}

int MpDevice::set_sample_rate(double rate_hz) {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;
    if (!(rate_hz > 0)) return MPINVPARA;

    return library->setSampleRate(sample_interval_ms(rate_hz));
}

int MpDevice::set_channels(ChannelSpec* channels) {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;
    if (channels == nullptr || channels->getCount() == 0) return MPINVPARA;

    int r = library->setAcqChannels(channels->getMask());
    if (r == MPSUCCESS) {
        channel_count = channels->getCount();
    }
    return r;
}

int MpDevice::start_acquisition() {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;

    int r = library->startAcquisition();
    acquiring = r == MPSUCCESS;
    return r;
}

int MpDevice::get_most_recent_sample(std::vector<double>& sample) {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;

    // the vendor writes one value per active channel, but never fewer than the full set
    std::vector<double> data(ChannelSpec::MAX_CHANNELS, 0.0);
    int r = library->getMostRecentSample(data.data());
    if (r != MPSUCCESS) return r;

    data.resize(channel_count);
    sample.swap(data);
    return r;
}

int MpDevice::read_buffer(uint32_t frames, std::vector<double>& samples) {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;
    if (frames == 0 || channel_count == 0) return MPINVPARA;
    // the vendor counts values in 32 bits
    if (frames > UINT32_MAX / ChannelSpec::MAX_CHANNELS) return MPINVPARA;

    std::vector<double> data((size_t) frames * channel_count, 0.0);
    uint32_t received = 0;
    int r = library->getMPBuffer(frames, &received, data.data());
    if (r != MPSUCCESS) return r;

    if (received > frames) received = frames;
    data.resize((size_t) received * channel_count);
    samples.swap(data);
    return r;
}

int MpDevice::stop_acquisition() {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;

    int r = library->stopAcquisition();
    if (r == MPSUCCESS) acquiring = false;
    return r;
}

int MpDevice::disconnect() {
    VendorLibrary* library = VendorLibrary::get();
    if (library == nullptr) return MPDRVERR;
    if (!connected) return MPNOTCON;

    if (acquiring) {
        int r = stop_acquisition();
        if (r != MPSUCCESS) {
            std::cerr << "WARNING: stopping acquisition failed: " << describe(r) << "\n";
        }
    }

    int r = library->disconnectMPDev();
    if (r == MPSUCCESS) {
        connected = false;
        acquiring = false;
        channel_count = 0;
    }
    return r;
}

bool MpDevice::is_connected() {
    return connected;
}

bool MpDevice::is_acquiring() {
    return acquiring;
}

int MpDevice::get_channel_count() {
    return channel_count;
}
