#include "devices.hpp"

#include "errors.hpp"
#include "utility.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

bool has_role(const DeviceInfo& d, DeviceRole role) {
    return role == DeviceRole::Input ? d.maxInputChannels > 0 : d.maxOutputChannels > 0;
}

const DeviceInfo* find_index(const std::vector<DeviceInfo>& all, int index) {
    for (const DeviceInfo& d : all) {
        if (d.index == index) return &d;
    }
    return nullptr;
}

DeviceHandle handle_of(const DeviceInfo& d) { return DeviceHandle{d.index, d.name}; }

} // namespace

std::vector<DeviceInfo> input_devices(const std::vector<DeviceInfo>& all) {
    std::vector<DeviceInfo> out;
    for (const DeviceInfo& d : all) {
        if (has_role(d, DeviceRole::Input)) out.push_back(d);
    }
    return out;
}

std::vector<DeviceInfo> output_devices(const std::vector<DeviceInfo>& all) {
    std::vector<DeviceInfo> out;
    for (const DeviceInfo& d : all) {
        if (has_role(d, DeviceRole::Output)) out.push_back(d);
    }
    return out;
}

DeviceHandle select_input_device(const std::vector<DeviceInfo>& all, int defaultIndex) {
    std::vector<DeviceInfo> inputs = input_devices(all);
    if (inputs.empty()) throw DeviceError("No audio input devices available.");

    for (const DeviceInfo& d : inputs) {
        if (contains_ci(d.name, "mic")) return handle_of(d);
    }

    const DeviceInfo* def = find_index(inputs, defaultIndex);
    if (def) return handle_of(*def);

    return handle_of(inputs.front());
}

DeviceHandle select_output_device(const std::vector<DeviceInfo>& all, int defaultIndex) {
    std::vector<DeviceInfo> outputs = output_devices(all);
    if (outputs.empty()) throw DeviceError("No audio output devices available.");

    const DeviceInfo* def = find_index(outputs, defaultIndex);
    if (def) return handle_of(*def);

    return handle_of(outputs.front());
}

DeviceHandle resolve_device(const std::vector<DeviceInfo>& all, int index, DeviceRole role) {
    const DeviceInfo* d = find_index(all, index);
    if (!d) throw DeviceError("No audio device with index " + std::to_string(index));
    if (!has_role(*d, role)) {
        throw DeviceError("Selected device has no " +
                          std::string(role == DeviceRole::Input ? "input" : "output") +
                          " channels: " + d->name);
    }
    return handle_of(*d);
}

std::string describe_device(const DeviceInfo& d) {
    std::ostringstream os;
    os << "[" << d.index << "] " << d.name
       << " (in: " << d.maxInputChannels << ", out: " << d.maxOutputChannels
       << ", " << d.defaultSampleRate << " Hz)";
    return os.str();
}
