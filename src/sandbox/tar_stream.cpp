#include "sandbox/tar_stream.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace stockade::sandbox {
namespace {

constexpr std::size_t kBlock = 512;

struct Field {
    std::size_t offset;
    std::size_t length;
};

constexpr Field kName{0, 100};
constexpr Field kMode{100, 8};
constexpr Field kUid{108, 8};
constexpr Field kGid{116, 8};
constexpr Field kSize{124, 12};
constexpr Field kMtime{136, 12};
constexpr Field kChecksum{148, 8};
constexpr Field kType{156, 1};
constexpr Field kMagic{257, 6};
constexpr Field kVersion{263, 2};
constexpr Field kPrefix{345, 155};

void WriteOctal(char* header, Field field, unsigned long long value) {
    // length - 1 digits followed by NUL.
    std::snprintf(header + field.offset, field.length, "%0*llo",
                  static_cast<int>(field.length - 1), value);
}

std::string ReadString(const char* header, Field field) {
    const char* begin = header + field.offset;
    const auto length = strnlen(begin, field.length);
    return std::string(begin, length);
}

unsigned long long ReadOctal(const char* header, Field field) {
    unsigned long long value = 0;
    for (std::size_t i = 0; i < field.length; ++i) {
        const char c = header[field.offset + i];
        if (c == ' ' || c == '\0') {
            if (value != 0) {
                break;
            }
            continue;
        }
        if (c < '0' || c > '7') {
            throw std::runtime_error("tar: bad octal field");
        }
        value = value * 8 + static_cast<unsigned>(c - '0');
    }
    return value;
}

unsigned Checksum(const char* header) {
    unsigned sum = 0;
    for (std::size_t i = 0; i < kBlock; ++i) {
        const bool in_checksum = i >= kChecksum.offset && i < kChecksum.offset + kChecksum.length;
        sum += in_checksum ? static_cast<unsigned>(' ') : static_cast<unsigned char>(header[i]);
    }
    return sum;
}

std::size_t Padded(std::size_t size) {
    return (size + kBlock - 1) / kBlock * kBlock;
}

// Extracts the "path" record of a PAX extended header body.
std::string PaxPath(std::string_view body) {
    std::size_t pos = 0;
    while (pos < body.size()) {
        const auto space = body.find(' ', pos);
        if (space == std::string_view::npos) {
            break;
        }
        const auto length = std::stoul(std::string(body.substr(pos, space - pos)));
        if (length == 0 || pos + length > body.size()) {
            break;
        }
        const auto record = body.substr(space + 1, pos + length - space - 2);
        if (record.rfind("path=", 0) == 0) {
            return std::string(record.substr(5));
        }
        pos += length;
    }
    return {};
}

}  // namespace

std::string BuildTar(const std::vector<TarEntry>& entries) {
    std::string archive;
    const auto now = static_cast<unsigned long long>(std::time(nullptr));
    for (const auto& entry : entries) {
        if (entry.name.empty() || entry.name.size() >= kName.length) {
            throw std::invalid_argument("tar: unsupported entry name '" + entry.name + "'");
        }
        char header[kBlock];
        std::memset(header, 0, sizeof(header));
        std::memcpy(header + kName.offset, entry.name.data(), entry.name.size());
        WriteOctal(header, kMode, entry.mode);
        WriteOctal(header, kUid, 0);
        WriteOctal(header, kGid, 0);
        WriteOctal(header, kSize, entry.data.size());
        WriteOctal(header, kMtime, now);
        header[kType.offset] = '0';
        std::memcpy(header + kMagic.offset, "ustar", 6);
        std::memcpy(header + kVersion.offset, "00", 2);
        std::snprintf(header + kChecksum.offset, kChecksum.length, "%06o", Checksum(header));
        header[kChecksum.offset + 7] = ' ';

        archive.append(header, kBlock);
        archive.append(entry.data);
        archive.append(Padded(entry.data.size()) - entry.data.size(), '\0');
    }
    archive.append(2 * kBlock, '\0');
    return archive;
}

std::vector<TarEntry> ParseTar(std::string_view archive) {
    std::vector<TarEntry> entries;
    std::string long_name;
    std::size_t offset = 0;
    while (offset + kBlock <= archive.size()) {
        const char* header = archive.data() + offset;
        if (std::all_of(header, header + kBlock, [](char c) { return c == '\0'; })) {
            break;
        }
        if (ReadOctal(header, kChecksum) != Checksum(header)) {
            throw std::runtime_error("tar: header checksum mismatch");
        }
        const auto size = static_cast<std::size_t>(ReadOctal(header, kSize));
        const auto data_offset = offset + kBlock;
        if (data_offset + size > archive.size()) {
            throw std::runtime_error("tar: truncated entry");
        }
        const auto body = archive.substr(data_offset, size);
        const char type = header[kType.offset];

        if (type == 'L') {
            long_name = std::string(body.data(), strnlen(body.data(), body.size()));
        } else if (type == 'x') {
            long_name = PaxPath(body);
        } else if (type == '0' || type == '\0' || type == '7') {
            TarEntry entry{};
            if (!long_name.empty()) {
                entry.name = long_name;
            } else {
                const auto prefix = ReadString(header, kPrefix);
                const auto name = ReadString(header, kName);
                entry.name = prefix.empty() ? name : prefix + "/" + name;
            }
            entry.mode = static_cast<unsigned>(ReadOctal(header, kMode));
            entry.data = std::string(body);
            entries.push_back(std::move(entry));
            long_name.clear();
        } else {
            long_name.clear();
        }
        offset = data_offset + Padded(size);
    }
    return entries;
}

}  // namespace stockade::sandbox
