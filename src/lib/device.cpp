#include "physio/device.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

using namespace Physio;

const int CommunicationType::USB;
const int CommunicationType::UDP;
const int ChannelSpec::MAX_CHANNELS;

static std::string to_upper(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c){ return std::toupper(c); });
    return input;
}

static std::string to_lower(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c){ return std::tolower(c); });
    return input;
}

static std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// returns -1 unless the whole string is a non-negative decimal number
static long parse_index(const std::string& input) {
    if (input.empty()) return -1;
    char* end;
    long value = std::strtol(input.c_str(), &end, 10);
    if (*end != '\0' || value < 0 || input[0] == '-' || input[0] == '+') return -1;
    return value;
}

DeviceType::DeviceType(std::string new_name, int new_code) {
    name = new_name;
    code = new_code;
}

DeviceType* DeviceType::parse(std::string input) {
    std::string upper = to_upper(trim(input));
    if (upper == "MP150") return new DeviceType(upper, 101);
    // MP160 and MP36R share the same device code
    if (upper == "MP160") return new DeviceType(upper, 103);
    if (upper == "MP36R") return new DeviceType(upper, 103);
    return nullptr;
}

std::string DeviceType::supported() {
    return "MP150, MP160, MP36R";
}

std::string DeviceType::getName() {
    return name;
}

int DeviceType::getCode() {
    return code;
}

int CommunicationType::parse(std::string input) {
    std::string lower = to_lower(trim(input));
    if (lower == "usb") return USB;
    if (lower == "udp") return UDP;
    return -1;
}

ChannelSpec::ChannelSpec() {
    std::fill(mask, mask + MAX_CHANNELS, 0);
}

ChannelSpec::ChannelSpec(int count): ChannelSpec() {
    for (int i = 0; i < count && i < MAX_CHANNELS; i++) {
        mask[i] = 1;
    }
}

ChannelSpec* ChannelSpec::parse(std::string input) {
    std::string trimmed = trim(input);
    if (trimmed.find(',') == std::string::npos) {
        long count = parse_index(trimmed);
        if (count < 1 || count > MAX_CHANNELS) return nullptr;
        return new ChannelSpec((int) count);
    }

    // getline drops an empty last field
    if (trimmed[trimmed.size() - 1] == ',') return nullptr;

    ChannelSpec* spec = new ChannelSpec();
    std::stringstream ss(trimmed);
    std::string item;
    while (std::getline(ss, item, ',')) {
        long index = parse_index(trim(item));
        if (index < 0 || index >= MAX_CHANNELS || spec->mask[index] != 0) {
            delete spec;
            return nullptr;
        }
        spec->mask[index] = 1;
    }
    if (spec->getCount() == 0) {
        delete spec;
        return nullptr;
    }
    return spec;
}

int* ChannelSpec::getMask() {
    return mask;
}

int ChannelSpec::getCount() {
    return (int) std::count(mask, mask + MAX_CHANNELS, 1);
}

std::vector<int> ChannelSpec::getChannels() {
    std::vector<int> channels;
    for (int i = 0; i < MAX_CHANNELS; i++) {
        if (mask[i]) channels.push_back(i);
    }
    return channels;
}

double Physio::sample_interval_ms(double rate_hz) {
    return 1000.0 / rate_hz;
}
