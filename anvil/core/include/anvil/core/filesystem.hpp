#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace anvil::core {

struct FileSystem {
    static bool exists(const std::string& path);
    static std::vector<uint8_t> read_binary(const std::string& path);
    static std::string read_text(const std::string& path);
    static bool write_binary(const std::string& path, const std::vector<uint8_t>& data);
    static bool write_text(const std::string& path, const std::string& text);

    // Writes to "<path>.tmp" and renames over the target so readers never see a partial file
    static bool write_binary_atomic(const std::string& path, const std::vector<uint8_t>& data);
    static bool remove(const std::string& path);
};

} // namespace anvil::core
