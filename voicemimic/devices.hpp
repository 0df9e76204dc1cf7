#pragma once

#include "audio_host.hpp"

#include <string>
#include <vector>

enum class DeviceRole { Input, Output };

std::vector<DeviceInfo> input_devices(const std::vector<DeviceInfo>& all);
std::vector<DeviceInfo> output_devices(const std::vector<DeviceInfo>& all);

// Input priority:
//   1. first input device whose name contains "mic" (case-insensitive)
//   2. the host default input device
//   3. the first input device
// Throws DeviceError when no device can record.
DeviceHandle select_input_device(const std::vector<DeviceInfo>& all, int defaultIndex);

// Output priority: host default, then the first device with output channels.
DeviceHandle select_output_device(const std::vector<DeviceInfo>& all, int defaultIndex);

// Explicit reselection by index; DeviceError if missing or lacking the role's channels.
DeviceHandle resolve_device(const std::vector<DeviceInfo>& all, int index, DeviceRole role);

std::string describe_device(const DeviceInfo& d);
