#include "file_store.h"
#include "fs.h"
#include "logger.h"
#include <cstdio>

// Store module logging macros
#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)
#define LOG_STORE_WARN(message)  LOG_WARN("store", message)
#define LOG_STORE_ERROR(message) LOG_ERROR("store", message)

namespace sharebox {

namespace {
const char kTempPrefix[] = ".sharebox-upload-";
}

FileStore::FileStore(const std::string& root_directory)
    : root_(root_directory.empty() ? "." : root_directory), temp_counter_(0) {
}

bool FileStore::initialize() {
    if (!create_directories(root_)) {
        LOG_STORE_ERROR("Failed to create storage directory: " << root_);
        return false;
    }
    
    LOG_STORE_INFO("Files will be stored in: " << root_);
    return true;
}

bool FileStore::list_files(std::vector<FileEntry>& entries) const {
    std::vector<DirectoryEntry> dir_entries;
    if (!list_directory(root_.c_str(), dir_entries)) {
        LOG_STORE_ERROR("Failed to list storage directory: " << root_);
        return false;
    }
    
    entries.clear();
    for (const auto& entry : dir_entries) {
        if (entry.is_directory || is_temp_file(entry.name)) {
            continue;
        }
        if (!is_file(entry.path)) {
            continue;
        }
        entries.emplace_back(entry.name, entry.size, format_size(entry.size));
    }
    
    LOG_STORE_DEBUG("Listed " << entries.size() << " files in " << root_);
    return true;
}

bool FileStore::resolve_path(const std::string& filename, std::string& path) const {
    std::string base = sanitize_filename(filename);
    if (base.empty()) {
        LOG_STORE_WARN("Rejected filename: '" << filename << "'");
        return false;
    }
    
    if (base != filename) {
        LOG_STORE_DEBUG("Filename '" << filename << "' reduced to '" << base << "'");
    }
    
    path = combine_paths(root_, base);
    return true;
}

bool FileStore::contains(const std::string& filename) const {
    std::string path;
    return resolve_path(filename, path) && is_file(path);
}

std::string FileStore::create_temp_path(const std::string& sanitized_filename) {
    uint64_t id = temp_counter_.fetch_add(1);
    return combine_paths(root_, std::string(kTempPrefix) + std::to_string(id) + "-" + sanitized_filename);
}

std::string FileStore::sanitize_filename(const std::string& filename) {
    // The path helpers work on C strings and would cut the name at an embedded NUL
    if (filename.find('\0') != std::string::npos) {
        return "";
    }
    
    std::string base = get_filename_from_path(filename);
    
    if (base.empty() || base == "." || base == "..") {
        return "";
    }
    if (is_temp_file(base)) {
        return "";
    }
    
    return base;
}

std::string FileStore::format_size(uint64_t size) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    
    double value = static_cast<double>(size);
    for (const char* unit : units) {
        if (value < 1024.0) {
            char buffer[64];
            snprintf(buffer, sizeof(buffer), "%.2f %s", value, unit);
            return buffer;
        }
        value /= 1024.0;
    }
    
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.2f PB", value);
    return buffer;
}

bool FileStore::is_temp_file(const std::string& name) {
    return name.compare(0, sizeof(kTempPrefix) - 1, kTempPrefix) == 0;
}

} // namespace sharebox
