#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace stockade::sandbox {

struct TarEntry {
    std::string name;
    std::string data;
    unsigned mode = 0644;
};

// POSIX ustar archive of regular files, terminated by two zero blocks.
// Names longer than 100 bytes are rejected with std::invalid_argument.
std::string BuildTar(const std::vector<TarEntry>& entries);

// Regular files in archive order. PAX and GNU long-name records are
// honoured; directories, links and devices are skipped. Throws
// std::runtime_error on a truncated archive or a bad header checksum.
std::vector<TarEntry> ParseTar(std::string_view archive);

}  // namespace stockade::sandbox
