#include "physio/mp_connector.hpp"
#include "physio/vendor_library.hpp"
#include "physio/returncode.hpp"
#include <iostream>
#include <cstdlib>
#include <stdexcept>

using namespace Physio;

MpConnector::MpConnector() {
    type = DeviceType::parse("MP150");
    channels = new ChannelSpec(3);
    device = new MpDevice();
    session = new Session(device);
    session->set_sample_callback([this] (const std::vector<double>& sample) {
        processSamples(sample.data(), sample.size());
    });
}

MpConnector::~MpConnector() {
    delete session;
    delete device;
    delete channels;
    delete type;
}

uint32_t MpConnector::get_buffer_size() {
    return mp_buffer_size;
}

std::stringstream MpConnector::get_usage_string() {
    std::stringstream s = Connector::get_usage_string();
    s <<
        " -l, --library           path to the mpdev library (default: " << VendorLibrary::DEFAULT_NAME << ")\n" <<
        " -t, --type              device type: " << DeviceType::supported() << " (default: MP150)\n" <<
        " -m, --comm              communication type: usb or udp (default: udp)\n" <<
        " -n, --channels          number of channels, or a list of channel indices (default: 3)\n" <<
        " -o, --logfile           log file name prefix (default: default)\n" <<
        " -w, --overwrite         overwrite an existing log file\n" <<
        " -R, --record            start recording to the log file immediately\n";
    return s;
}

std::vector<struct option> MpConnector::getopt_long_options() {
    std::vector<struct option> long_options = Connector::getopt_long_options();
    long_options.push_back({"library", required_argument, NULL, 'l'});
    long_options.push_back({"type", required_argument, NULL, 't'});
    long_options.push_back({"comm", required_argument, NULL, 'm'});
    long_options.push_back({"channels", required_argument, NULL, 'n'});
    long_options.push_back({"logfile", required_argument, NULL, 'o'});
    long_options.push_back({"overwrite", no_argument, NULL, 'w'});
    long_options.push_back({"record", no_argument, NULL, 'R'});
    return long_options;
}

int MpConnector::receive_option(int c, char* optarg) {
    switch (c) {
        case 'l':
            library_path = std::string(optarg);
            break;
        case 't': {
            DeviceType* parsed = DeviceType::parse(optarg);
            if (parsed == nullptr) {
                std::cerr << "unknown device name \"" << optarg << "\"; supported devices are: " << DeviceType::supported() << "\n";
                return 2;
            }
            delete type;
            type = parsed;
            break;
        }
        case 'm':
            comm = CommunicationType::parse(optarg);
            if (comm < 0) {
                std::cerr << "unknown communication type \"" << optarg << "\"; use usb or udp\n";
                return 2;
            }
            break;
        case 'n': {
            ChannelSpec* parsed = ChannelSpec::parse(optarg);
            if (parsed == nullptr) {
                std::cerr << "invalid channel selection \"" << optarg << "\"; 1-16 channels can be recorded\n";
                return 2;
            }
            delete channels;
            channels = parsed;
            break;
        }
        case 'o':
            logfile = std::string(optarg);
            break;
        case 'w':
            overwrite = true;
            break;
        case 'R':
            record = true;
            break;
        default:
            return Connector::receive_option(c, optarg);
    }
    return 0;
}

void MpConnector::print_version() {
    std::cout << "mp_connector version " << VERSION << "\n";
    Connector::print_version();
}

int MpConnector::open() {
    int r = VendorLibrary::load(library_path);
    if (r != 0) {
        return 1;
    }

    session_params params = {
        type,
        comm,
        device_id == nullptr ? "auto" : std::string(device_id),
        get_sample_rate(),
        channels,
        logfile,
        overwrite
    };

    std::lock_guard<std::mutex> lck(devMutex);
    r = session->open(params);
    if (r != MPSUCCESS) {
        std::cerr << "opening the session failed: " << describe(r) << "\n";
        return 2;
    }
    pending_sample_rate = 0;
    return 0;
}

int MpConnector::setup() {
    // the sample rate has already been applied while opening the session
    if (record) {
        session->start_recording();
    }
    return 0;
}

int MpConnector::read() {
    int r;
    while (run) {
        r = apply_pending_sample_rate();
        if (r != MPSUCCESS) {
            std::cerr << "ERROR: changing the sample rate failed: " << describe(r) << "\n";
            break;
        }

        r = session->poll();
        if (r != MPSUCCESS) {
            std::cerr << "ERROR: failed to obtain a sample: " << describe(r) << "\n";
            break;
        }
    }
    return 0;
}

int MpConnector::close() {
    std::lock_guard<std::mutex> lck(devMutex);
    int r = session->close();
    // a device that went away cannot be disconnected cleanly, which should not end the connector
    if (r != MPSUCCESS && r != MPNOTCON) {
        return 1;
    }
    return 0;
}

int MpConnector::set_sample_rate(double sample_rate) {
    std::lock_guard<std::mutex> lck(devMutex);
    pending_sample_rate = sample_rate;
    return 0;
}

int MpConnector::apply_pending_sample_rate() {
    std::lock_guard<std::mutex> lck(devMutex);
    if (pending_sample_rate <= 0) return MPSUCCESS;
    double rate = pending_sample_rate;
    pending_sample_rate = 0;

    // the vendor only accepts a new rate while not acquiring
    int r = device->stop_acquisition();
    if (r != MPSUCCESS) return r;
    r = device->set_sample_rate(rate);
    if (r != MPSUCCESS) return r;
    r = device->start_acquisition();
    if (r != MPSUCCESS) return r;

    std::cout << "sample rate changed to " << rate << " Hz\n";
    return MPSUCCESS;
}

void MpConnector::dump_buffer() {
    std::vector<double> buffer = session->get_buffer();
    std::cout << "buffer (" << buffer.size() << " samples):";
    for (size_t i = 0; i < buffer.size(); i++) {
        std::cout << (i == 0 ? " " : ", ") << buffer[i];
    }
    std::cout << "\n";
}

void MpConnector::applyChange(std::string key, std::string value) {
    int r = 0;
    if (key == "recording") {
        if (convertBooleanValue(value)) {
            session->start_recording();
        } else {
            r = session->stop_recording();
        }
    } else if (key == "log") {
        r = session->log(value);
    } else if (key == "buffer") {
        if (value == "off" || value == "None") {
            session->stop_recording_to_buffer();
        } else {
            char* end;
            long channel = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0') {
                std::cerr << "WARNING: invalid buffer channel: \"" << value << "\"\n";
                return;
            }
            r = session->start_recording_to_buffer((int) channel);
            if (r == MPSUCCESS) r = 0;
        }
    } else if (key == "dump_buffer") {
        dump_buffer();
    } else {
        Connector::applyChange(key, value);
        return;
    }
    if (r != 0) {
        std::cerr << "WARNING: setting \"" << key << "\" failed: " << r << "\n";
    }
}
