#pragma once

#define PRANA_VERSION "1.3.0"
#define PRANA_CONFIG_VERSION_MAJOR 1
#define PRANA_CONFIG_VERSION_MINOR 0

namespace prana {
namespace version {

inline bool config_compatible(int major, int minor) {
    // Major version must match exactly (renamed/removed keys)
    // Minor version: reader must be >= writer (added keys only)
    return major == PRANA_CONFIG_VERSION_MAJOR &&
           minor <= PRANA_CONFIG_VERSION_MINOR;
}

} // namespace version
} // namespace prana
