#include "utils/common.hpp"

#include <random>

#include <openssl/evp.h>

namespace stockade::utils {

std::string Base64Encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    encoded.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return encoded;
}

std::string RandomHex(std::size_t length) {
    static constexpr char kChars[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

}  // namespace stockade::utils
