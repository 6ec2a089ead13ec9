#include <anvil/core/filesystem.hpp>
#include <anvil/core/log.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace anvil::core {

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::vector<uint8_t> FileSystem::read_binary(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) return {};

    auto size = file.tellg();
    if (size <= 0) return {};
    file.seekg(0);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) return {};
    return data;
}

std::string FileSystem::read_text(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    return std::string(
        std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>()
    );
}

bool FileSystem::write_binary(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

bool FileSystem::write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) return false;
    file << text;
    return file.good();
}

bool FileSystem::write_binary_atomic(const std::string& path, const std::vector<uint8_t>& data) {
    std::string temp_path = path + ".tmp";
    if (!write_binary(temp_path, data)) {
        remove(temp_path);
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        log(LogLevel::Error, "[FileSystem] Failed to move {} into place: {}", temp_path, ec.message());
        remove(temp_path);
        return false;
    }
    return true;
}

bool FileSystem::remove(const std::string& path) {
    std::error_code ec;
    return std::filesystem::remove(path, ec);
}

} // namespace anvil::core
