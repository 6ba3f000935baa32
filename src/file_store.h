#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <cstdint>

namespace sharebox {

/**
 * One row of the shared file listing
 */
struct FileEntry {
    std::string name;
    uint64_t size;
    std::string size_formatted;
    
    FileEntry() : size(0) {}
    FileEntry(const std::string& n, uint64_t s, const std::string& f) : name(n), size(s), size_formatted(f) {}
};

/**
 * Flat directory of shared files.
 * Filenames are the only identity; every name coming from the network is
 * reduced to its base component before it is resolved against the root.
 */
class FileStore {
public:
    explicit FileStore(const std::string& root_directory);
    
    /**
     * Create the root directory if it does not exist
     * @return true if the root exists afterwards
     */
    bool initialize();
    
    const std::string& get_root() const { return root_; }
    
    /**
     * Enumerate regular files in the root, in directory order.
     * Upload temporaries are not listed.
     * @param entries Output entries
     * @return true if the root could be read
     */
    bool list_files(std::vector<FileEntry>& entries) const;
    
    /**
     * Resolve a client-supplied name to a path inside the root
     * @param filename Name as received
     * @param path Output path
     * @return false if the name has no usable base component
     */
    bool resolve_path(const std::string& filename, std::string& path) const;
    
    /**
     * Check that a client-supplied name resolves to an existing regular file
     */
    bool contains(const std::string& filename) const;
    
    /**
     * Unique hidden path in the root used while an upload is in progress
     */
    std::string create_temp_path(const std::string& sanitized_filename);
    
    /**
     * Reduce a name to its last path component.
     * Returns an empty string for names that are empty, "." or ".." after
     * reduction, or that collide with the upload temporary prefix.
     */
    static std::string sanitize_filename(const std::string& filename);
    
    /**
     * Human readable size with two decimals: "512.00 B", "1.50 KB", ... "2.00 PB"
     */
    static std::string format_size(uint64_t size);
    
    static bool is_temp_file(const std::string& name);

private:
    std::string root_;
    std::atomic<uint64_t> temp_counter_;
};

} // namespace sharebox
