#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace stockade::utils {

inline double ElapsedMs(std::chrono::steady_clock::time_point start) {
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

// Standard base64 with padding, as used for screenshot payloads in JSON.
std::string Base64Encode(std::string_view data);

// Random lowercase hex string, used for scratch directory names.
std::string RandomHex(std::size_t length);

}  // namespace stockade::utils
