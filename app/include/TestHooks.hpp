#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace TestHooks {

// Returns the volume id for a path; nullopt means unknown (treated as another volume).
using VolumeProbe = std::function<std::optional<std::uint64_t>(const std::string& path)>;
void set_volume_probe(VolumeProbe probe);
void reset_volume_probe();

} // namespace TestHooks
