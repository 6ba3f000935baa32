#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace sharebox {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);
bool create_file_binary(const char* path, const void* data, size_t size);

// File reading
bool read_file_text(const char* path, std::string& content);

// Directory operations
bool create_directory(const char* path);
bool create_directories(const char* path); // Create parent directories if needed

// File information
int64_t get_file_size(const char* path);
bool is_file(const char* path);

// File operations
bool delete_file(const char* path);
bool delete_directory(const char* path);
bool rename_file(const char* old_path, const char* new_path); // Replaces an existing destination

// Path utilities
std::string get_filename_from_path(const char* path);
std::string combine_paths(const std::string& base, const std::string& relative);

// File chunk operations
bool write_file_chunk(const char* path, uint64_t offset, const void* data, size_t size);
bool read_file_chunk(const char* path, uint64_t offset, void* buffer, size_t size);

// Directory listing
struct DirectoryEntry {
    std::string name;
    std::string path;
    bool is_directory;
    uint64_t size;
};
bool list_directory(const char* path, std::vector<DirectoryEntry>& entries);

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) { 
    return create_file(path.c_str(), content.c_str()); 
}
inline bool read_file_text(const std::string& path, std::string& content) { return read_file_text(path.c_str(), content); }
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline bool rename_file(const std::string& old_path, const std::string& new_path) { 
    return rename_file(old_path.c_str(), new_path.c_str()); 
}
inline std::string get_filename_from_path(const std::string& path) { return get_filename_from_path(path.c_str()); }
inline bool write_file_chunk(const std::string& path, uint64_t offset, const void* data, size_t size) { 
    return write_file_chunk(path.c_str(), offset, data, size); 
}
inline bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size) { 
    return read_file_chunk(path.c_str(), offset, buffer, size); 
}

} // namespace sharebox
