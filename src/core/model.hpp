#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "../adapters/object_store.hpp"

namespace bucketcp::core {

using adapters::RemoteObject;

// Локальный файл, найденный шаблоном (путь относительно корня обхода)
struct LocalFile {
    std::string path;
    std::uint64_t size = 0;
};

struct UploadTask {
    std::filesystem::path source;
    std::string key;
    std::uint64_t size = 0;
};

struct DownloadTask {
    std::string key;
    std::filesystem::path destination;
    std::uint64_t size = 0;
};

struct DeleteTask {
    std::string key;
    std::uint64_t size = 0;
};

} // namespace bucketcp::core
