#pragma once

#include <datapod/datapod.hpp>

#include <string>

namespace trueform {

    /// JSON-RPC API generation this library speaks
    /// Served at /api/current by TrueNAS Scale 25.04 and later
    constexpr const char *API_GENERATION = "25.04";

    /// Library version information
    struct Version {
        dp::u8 major;
        dp::u8 minor;
        dp::u8 patch;

        /// Get version as string "major.minor.patch"
        inline dp::String to_string() const {
            return dp::String(std::to_string(major).c_str()) + "." + dp::String(std::to_string(minor).c_str()) + "." +
                   dp::String(std::to_string(patch).c_str());
        }
    };

    /// Current library version
    constexpr Version LIBRARY_VERSION = {0, 1, 0}; // 0.1.0

    inline dp::String get_version_string() { return LIBRARY_VERSION.to_string(); }

} // namespace trueform
