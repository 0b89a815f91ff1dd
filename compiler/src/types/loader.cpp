//! # Source Loaders
//!
//! The file-reading capability handed to the resolver. Tests use the
//! in-memory loader so resolution never touches the real file system.

#include "types/resolver.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace yuho::types {

auto normalize_path(const std::string& path) -> std::string {
    auto normal = std::filesystem::path(path).lexically_normal().generic_string();
    if (normal.size() > 2 && normal.rfind("./", 0) == 0) {
        normal.erase(0, 2);
    }
    if (normal == ".") {
        return "";
    }
    return normal;
}

// ============================================================================
// File System
// ============================================================================

auto FileSystemSourceLoader::exists(const std::string& path) const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystemSourceLoader::read(const std::string& path) const
    -> Result<std::string, ReadError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ReadError{.path = path, .message = "failed to open file"};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ReadError{.path = path, .message = "failed to read file"};
    }
    return buffer.str();
}

// ============================================================================
// Memory
// ============================================================================

void MemorySourceLoader::add(const std::string& path, std::string content) {
    files_[normalize_path(path)] = std::move(content);
}

auto MemorySourceLoader::exists(const std::string& path) const -> bool {
    return files_.count(normalize_path(path)) > 0;
}

auto MemorySourceLoader::read(const std::string& path) const -> Result<std::string, ReadError> {
    auto it = files_.find(normalize_path(path));
    if (it == files_.end()) {
        return ReadError{.path = path, .message = "no such file"};
    }
    return it->second;
}

} // namespace yuho::types
