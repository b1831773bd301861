#include "physio/connector.hpp"
#include "sample_connection.hpp"
#include "control_connection.hpp"
#include "fmv.h"
#include <stdlib.h>
#include <algorithm>
#include <numeric>
#include <iostream>
#include <cstring>
#include <cctype>
#include <csignal>
#include <functional>
#include <thread>
#include <chrono>
#include <stdexcept>

using namespace Physio;

void Connector::init_buffers() {
    float_buffer = new Csdr::Ringbuffer<float>(10 * get_buffer_size());
}

std::function<void(int)> signal_callback_wrapper;
void signal_callback_function(int value) {
    signal_callback_wrapper(value);
}

int Connector::main(int argc, char** argv) {
    signal_callback_wrapper = std::bind(&Connector::handle_signal, this, std::placeholders::_1);
    std::signal(SIGINT, &signal_callback_function);
    std::signal(SIGTERM, &signal_callback_function);
    std::signal(SIGQUIT, &signal_callback_function);

    int r = parse_arguments(argc, argv);
    if (r == 1) {
        // print usage and exit
        return 0;
    } else if (r != 0) {
        return 1;
    }

    init_buffers();

    if (control_port > 0) {
        new ControlSocket(this, control_port);
    }

    SampleSocket* sample_socket = new SampleSocket(port, float_buffer);
    sample_socket->start();

    while (run) {
        r = open();
        if (r != 0) {
            std::cerr << "Connector::open() failed\n";
            return 1;
        }

        r = setup();
        if (r != 0) {
            std::cerr << "Connector::setup() failed\n";
            return 2;
        }

        r = read();
        if (r != 0) {
            std::cerr << "Connector::read() failed\n";
            return 3;
        }

        r = close();
        if (r != 0) {
            std::cerr << "Connector::close() failed\n";
            return 4;
        }

        if (run) std::this_thread::sleep_for(std::chrono::milliseconds(5000));
    }

    return 0;
}

void Connector::handle_signal(int signal) {
    std::cerr << "received signal: " << signal << "\n";
    stop();
}

std::vector<struct option> Connector::getopt_long_options() {
    return std::vector<struct option> {
        {"help", no_argument, NULL, 'h'},
        {"version", no_argument, NULL, 'v'},
        {"device", required_argument, NULL, 'd'},
        {"port", required_argument, NULL, 'p'},
        {"samplerate", required_argument, NULL, 's'},
        {"control", required_argument, NULL, 'c'},
    };
}

int Connector::parse_arguments(int argc, char** argv) {
    std::vector<struct option> long_options = getopt_long_options();
    long_options.push_back({ NULL, 0, NULL, 0 });

    std::vector<std::string> short_options;
    std::transform(
        long_options.begin(),
        long_options.end() - 1,
        std::inserter(short_options, short_options.end()),
        [](struct option opt){
            return std::string(1, opt.val) + (opt.has_arg == required_argument ? ":" : "");
        }
    );
    std::string short_options_string = std::accumulate(short_options.begin(), short_options.end(), std::string(""));

    program_name = argv[0];
    int c, r;
    while ((c = getopt_long(argc, argv, short_options_string.c_str(), long_options.data(), NULL)) != -1) {
        if (c == '?') return 2;
        r = receive_option(c, optarg);
        if (r != 0) return r;
    }
    return 0;
}

int Connector::receive_option(int c, char* optarg) {
    switch (c) {
        case 'h':
            print_usage();
            return 1;
        case 'v':
            print_version();
            return 1;
        case 'd':
            device_id = optarg;
            break;
        case 'p':
            port = std::strtoul(optarg, NULL, 10);
            break;
        case 's':
            sample_rate = std::strtod(optarg, NULL);
            if (sample_rate <= 0) {
                std::cerr << "invalid sample rate: \"" << optarg << "\"\n";
                return 2;
            }
            break;
        case 'c':
            control_port = std::strtoul(optarg, NULL, 10);
            break;
    }
    return 0;
}

std::stringstream Connector::get_usage_string() {
    std::stringstream s;
    s <<
        program_name << " version " << VERSION << "\n\n" <<
        "Usage: " << program_name << " [options]\n\n" <<
        "Available options:\n" <<
        " -h, --help              show this message\n" <<
        " -v, --version           print version and exit\n" <<
        " -d, --device            device serial number (default: auto)\n" <<
        " -p, --port              listen port (default: 4950)\n" <<
        " -s, --samplerate        use the specified samplerate in Hz (default: 200)\n" <<
        " -c, --control           control socket port (default: disabled)\n"
    ;
    return s;
}

void Connector::print_usage() {
    std::cerr << get_usage_string().str();
}

void Connector::print_version() {
    std::cout << "physio-connector version " << VERSION << "\n";
}

int Connector::setup() {
    int r = set_sample_rate(sample_rate);
    if (r != 0) {
        std::cerr << "setting sample rate failed\n";
        return 3;
    }

    return 0;
}

int Connector::stop() {
    run = false;
    return 0;
}

double Connector::get_sample_rate() {
    return sample_rate;
}

void Connector::applyChange(std::string key, std::string value) {
    int r = 0;
    if (key == "samp_rate") {
        double new_sample_rate;
        try {
            new_sample_rate = std::stod(value);
        } catch (const std::exception& e) {
            std::cerr << "WARNING: invalid value for \"" << key << "\": \"" << value << "\"\n";
            return;
        }
        if (new_sample_rate <= 0) {
            std::cerr << "WARNING: invalid value for \"" << key << "\": \"" << value << "\"\n";
            return;
        }
        sample_rate = new_sample_rate;
        r = set_sample_rate(sample_rate);
    } else {
        std::cerr << "could not set unknown key: \"" << key << "\"\n";
    }
    if (r != 0) {
        std::cerr << "WARNING: setting \"" << key << "\" failed: " << r << "\n";
    }
}

bool Connector::convertBooleanValue(std::string input) {
    std::string lower = input;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    return lower == "1" || lower == "true";
}

void Connector::processSamples(const double* input, uint32_t len) {
    uint32_t consumed = 0;
    uint32_t available;
    while (consumed < len) {
        available = std::min((uint32_t) float_buffer->writeable(), len - consumed);
        convert(input + consumed, float_buffer->getWritePointer(), available);
        float_buffer->advance(available);
        consumed += available;
    }
}

PHYSIO_CONNECTOR_TARGET_CLONES
void Connector::convert(const double* __restrict__ input, float* __restrict__ output, uint32_t len) {
    uint32_t i;
    for (i = 0; i < len; i++) {
        output[i] = (float) input[i];
    }
}

static std::string trim(const std::string &s) {
    std::string out = s;
    while (not out.empty() and std::isspace(out[0])) out = out.substr(1);
    while (not out.empty() and std::isspace(out[out.size()-1])) out = out.substr(0, out.size()-1);
    return out;
}

std::map<std::string, std::string> Connector::parseSettings(std::string unparsed) {
    bool inKey = true;
    std::map<std::string, std::string> output;
    std::string key, val;
    for (size_t i = 0; i < unparsed.size(); i++) {
        const char ch = unparsed[i];
        if (inKey) {
            if (ch == '=') inKey = false;
            else if (ch == ',') inKey = true;
            else key += ch;
        } else {
            if (ch == ',') inKey = true;
            else val += ch;
        }
        if ((inKey and (not val.empty() or (ch == ','))) or ((i+1) == unparsed.size())) {
            key = trim(key);
            val = trim(val);
            if (not key.empty()) output[key] = val;
            key = "";
            val = "";
        }
    }
    return output;
}
