// Polls the newest sample of an MP device and prints it until interrupted.
#include "physio/vendor_library.hpp"
#include "physio/mpdevice.hpp"
#include "physio/device.hpp"
#include "physio/returncode.hpp"
#include <getopt.h>
#include <csignal>
#include <cstdlib>
#include <chrono>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

using namespace Physio;

static volatile std::sig_atomic_t run = 1;

static void handle_signal(int) {
    run = 0;
}

static void print_usage(const char* program_name) {
    std::cerr <<
        "Usage: " << program_name << " [options]\n\n" <<
        "Available options:\n" <<
        " -h, --help              show this message\n" <<
        " -l, --library           path to the mpdev library (default: " << VendorLibrary::DEFAULT_NAME << ")\n" <<
        " -t, --type              device type: " << DeviceType::supported() << " (default: MP150)\n" <<
        " -m, --comm              communication type: usb or udp (default: udp)\n" <<
        " -d, --device            device serial number (default: auto)\n" <<
        " -s, --samplerate        samplerate in Hz (default: 200)\n" <<
        " -n, --channels          number of channels, or a list of channel indices (default: 3)\n";
}

static int check(int r, const char* what) {
    if (r != MPSUCCESS) {
        std::cerr << what << " failed: " << describe(r) << "\n";
    }
    return r;
}

int main(int argc, char** argv) {
    std::string library_path;
    std::string type_name = "MP150";
    std::string comm_name = "udp";
    std::string serial = "auto";
    double sample_rate = 200;
    std::string channel_spec = "3";

    struct option long_options[] = {
        {"help", no_argument, NULL, 'h'},
        {"library", required_argument, NULL, 'l'},
        {"type", required_argument, NULL, 't'},
        {"comm", required_argument, NULL, 'm'},
        {"device", required_argument, NULL, 'd'},
        {"samplerate", required_argument, NULL, 's'},
        {"channels", required_argument, NULL, 'n'},
        {NULL, 0, NULL, 0}
    };

    int c;
    while ((c = getopt_long(argc, argv, "hl:t:m:d:s:n:", long_options, NULL)) != -1) {
        switch (c) {
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 'l':
                library_path = optarg;
                break;
            case 't':
                type_name = optarg;
                break;
            case 'm':
                comm_name = optarg;
                break;
            case 'd':
                serial = optarg;
                break;
            case 's':
                sample_rate = std::strtod(optarg, NULL);
                break;
            case 'n':
                channel_spec = optarg;
                break;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    DeviceType* type = DeviceType::parse(type_name);
    if (type == nullptr) {
        std::cerr << "unknown device name \"" << type_name << "\"; supported devices are: " << DeviceType::supported() << "\n";
        return 1;
    }
    int comm = CommunicationType::parse(comm_name);
    if (comm < 0) {
        std::cerr << "unknown communication type \"" << comm_name << "\"\n";
        return 1;
    }
    ChannelSpec* channels = ChannelSpec::parse(channel_spec);
    if (channels == nullptr) {
        std::cerr << "invalid channel selection \"" << channel_spec << "\"\n";
        return 1;
    }

    if (VendorLibrary::load(library_path) != 0) {
        return 2;
    }

    std::signal(SIGINT, &handle_signal);
    std::signal(SIGTERM, &handle_signal);

    MpDevice device;
    if (check(device.connect(type, comm, serial), "connecting") != MPSUCCESS) return 3;
    if (check(device.set_sample_rate(sample_rate), "setting the samplerate") != MPSUCCESS ||
        check(device.set_channels(channels), "setting the channels") != MPSUCCESS ||
        check(device.start_acquisition(), "starting the acquisition") != MPSUCCESS) {
        check(device.disconnect(), "disconnecting");
        return 4;
    }

    std::vector<int> indices = channels->getChannels();
    std::vector<double> sample;
    auto last_print = std::chrono::steady_clock::now() - std::chrono::milliseconds(100);
    int status = 0;

    std::cout << std::fixed << std::setprecision(3);
    while (run) {
        if (check(device.get_most_recent_sample(sample), "reading a sample") != MPSUCCESS) {
            status = 5;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_print < std::chrono::milliseconds(100)) continue;
        last_print = now;

        std::cout << "sample =";
        for (size_t i = 0; i < sample.size(); i++) {
            std::cout << (i == 0 ? " " : ", ") << "ch" << indices[i] << ": " << sample[i];
        }
        std::cout << std::endl;
    }

    if (check(device.stop_acquisition(), "stopping the acquisition") != MPSUCCESS) status = 6;
    if (check(device.disconnect(), "disconnecting") != MPSUCCESS) status = 6;

    delete channels;
    delete type;
    VendorLibrary::unload();
    return status;
}
