#pragma once

#define PRAMANA_VERSION "0.4.0"
#define PRAMANA_FORMAT_VERSION_MAJOR 1
#define PRAMANA_FORMAT_VERSION_MINOR 0

namespace pramana {
namespace version {

inline bool format_compatible(int major, int minor) {
    // Major version must match exactly (breaking layout changes)
    // Minor version: reader must be >= writer (additive fields only)
    return major == PRAMANA_FORMAT_VERSION_MAJOR &&
           minor <= PRAMANA_FORMAT_VERSION_MINOR;
}

} // namespace version
} // namespace pramana
