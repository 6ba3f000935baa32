#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
    #define fseeko _fseeki64
    typedef __int64 file_offset_t;
#else
    #include <unistd.h>
    #include <dirent.h>
    #include <errno.h>
    typedef off_t file_offset_t;
#endif

// FS module logging macros
#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace sharebox {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;
    
    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFDIR) != 0;
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;
    return create_file_binary(path, content, content ? strlen(content) : 0);
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;
    
    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path);
        return false;
    }
    
    if (data && size > 0) {
        size_t written = fwrite(data, 1, size, file);
        if (written != size) {
            fclose(file);
            LOG_FS_ERROR("Failed to write complete data to file: " << path);
            return false;
        }
    }
    
    if (fclose(file) != 0) {
        LOG_FS_ERROR("Failed to flush file: " << path);
        return false;
    }
    return true;
}

bool read_file_text(const char* path, std::string& content) {
    if (!path) return false;
    
    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_DEBUG("Failed to open file for reading: " << path);
        return false;
    }
    
    std::string result;
    char buffer[4096];
    size_t bytes_read;
    while ((bytes_read = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        result.append(buffer, bytes_read);
    }
    
    bool ok = ferror(file) == 0;
    fclose(file);
    
    if (!ok) {
        LOG_FS_ERROR("Failed to read file: " << path);
        return false;
    }
    
    content.swap(result);
    return true;
}

bool create_directory(const char* path) {
    if (!path) return false;
    
    if (directory_exists(path)) {
        return true; // Already exists
    }
    
#ifdef _WIN32
    return _mkdir(path) == 0;
#else
    return mkdir(path, 0755) == 0;
#endif
}

bool create_directories(const char* path) {
    if (!path || !*path) return false;
    
    if (directory_exists(path)) {
        return true; // Already exists
    }
    
    std::string path_copy(path);
    
    // Create parent directories one component at a time
    for (size_t i = 1; i < path_copy.size(); i++) {
        if (path_copy[i] == '/' || path_copy[i] == '\\') {
            std::string prefix = path_copy.substr(0, i);
            if (!directory_exists(prefix.c_str()) && !create_directory(prefix.c_str())) {
                LOG_FS_ERROR("Failed to create directory: " << prefix);
                return false;
            }
        }
    }
    
    return create_directory(path_copy.c_str());
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;
    
    struct stat st;
    if (stat(path, &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool is_file(const char* path) {
    if (!path) return false;
    
    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFMT) == S_IFREG;
    }
    return false;
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

bool delete_directory(const char* path) {
    if (!path) return false;
    
#ifdef _WIN32
    return RemoveDirectoryA(path) != 0;
#else
    return rmdir(path) == 0;
#endif
}

bool rename_file(const char* old_path, const char* new_path) {
    if (!old_path || !new_path) return false;
    
#ifdef _WIN32
    return MoveFileExA(old_path, new_path, MOVEFILE_REPLACE_EXISTING) != 0;
#else
    return rename(old_path, new_path) == 0;
#endif
}

std::string get_filename_from_path(const char* path) {
    if (!path) return "";
    
    std::string p(path);
    
    // Ignore trailing separators
    while (!p.empty() && (p.back() == '/' || p.back() == '\\')) {
        p.pop_back();
    }
    
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return p;
    }
    return p.substr(pos + 1);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;
    
    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

bool write_file_chunk(const char* path, uint64_t offset, const void* data, size_t size) {
    if (!path || (!data && size > 0)) return false;
    
    // Open for update, creating the file on first write
    FILE* file = fopen(path, "r+b");
    if (!file) {
        file = fopen(path, "w+b");
    }
    if (!file) {
        LOG_FS_ERROR("Failed to open file for chunk write: " << path);
        return false;
    }
    
    if (fseeko(file, static_cast<file_offset_t>(offset), SEEK_SET) != 0) {
        LOG_FS_ERROR("Failed to seek to offset " << offset << " in " << path);
        fclose(file);
        return false;
    }
    
    size_t written = size > 0 ? fwrite(data, 1, size, file) : 0;
    int close_result = fclose(file);
    
    if (written != size || close_result != 0) {
        LOG_FS_ERROR("Failed to write chunk of " << size << " bytes at offset " << offset << " to " << path);
        return false;
    }
    
    return true;
}

bool read_file_chunk(const char* path, uint64_t offset, void* buffer, size_t size) {
    if (!path || (!buffer && size > 0)) return false;
    
    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_ERROR("Failed to open file for chunk read: " << path);
        return false;
    }
    
    if (fseeko(file, static_cast<file_offset_t>(offset), SEEK_SET) != 0) {
        LOG_FS_ERROR("Failed to seek to offset " << offset << " in " << path);
        fclose(file);
        return false;
    }
    
    size_t bytes_read = size > 0 ? fread(buffer, 1, size, file) : 0;
    fclose(file);
    
    if (bytes_read != size) {
        LOG_FS_ERROR("Short read from " << path << ": " << bytes_read << "/" << size << " bytes at offset " << offset);
        return false;
    }
    
    return true;
}

bool list_directory(const char* path, std::vector<DirectoryEntry>& entries) {
    if (!path) return false;
    
    entries.clear();
    
#ifdef _WIN32
    std::string search_path = std::string(path) + "\\*";
    WIN32_FIND_DATAA find_data;
    HANDLE handle = FindFirstFileA(search_path.c_str(), &find_data);
    if (handle == INVALID_HANDLE_VALUE) {
        LOG_FS_ERROR("Failed to open directory: " << path);
        return false;
    }
    
    do {
        std::string name = find_data.cFileName;
        if (name == "." || name == "..") continue;
        
        DirectoryEntry entry;
        entry.name = name;
        entry.path = combine_paths(path, name);
        entry.is_directory = (find_data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) != 0;
        entry.size = entry.is_directory ? 0 :
            (static_cast<uint64_t>(find_data.nFileSizeHigh) << 32) | find_data.nFileSizeLow;
        entries.push_back(entry);
    } while (FindNextFileA(handle, &find_data));
    
    FindClose(handle);
#else
    DIR* dir = opendir(path);
    if (!dir) {
        LOG_FS_ERROR("Failed to open directory: " << path);
        return false;
    }
    
    struct dirent* ent;
    while ((ent = readdir(dir)) != nullptr) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        
        DirectoryEntry entry;
        entry.name = name;
        entry.path = combine_paths(path, name);
        
        struct stat st;
        if (stat(entry.path.c_str(), &st) != 0) {
            // Entry vanished between readdir and stat
            continue;
        }
        entry.is_directory = S_ISDIR(st.st_mode);
        entry.size = entry.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
        entries.push_back(entry);
    }
    
    closedir(dir);
#endif
    
    return true;
}

} // namespace sharebox
