#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>

/// @brief Raised when a path is malformed or resolves outside the sandbox root
class SandboxViolation : public std::runtime_error {
public:
    explicit SandboxViolation(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Raised when read/list targets do not exist
class SandboxNotFound : public std::runtime_error {
public:
    explicit SandboxNotFound(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Filesystem access confined to one project directory
/// All paths are relative to the root. A path is rejected before resolution
/// if it is empty, absolute, or has a ".." segment, and again after
/// resolution if the canonical result does not lie under the canonical root
/// (symlinks pointing outside are caught by the second check).
class SandboxFilesystem {
public:
    struct Listing {
        std::vector<std::string> files;  // relative to root, sorted
        std::vector<std::string> dirs;   // relative to root, sorted
    };

    /// @param root Project directory; created if missing
    explicit SandboxFilesystem(const std::string& root);

    const std::filesystem::path& root() const { return root_; }

    /// @brief Write content, creating intermediate directories
    void write(const std::string& path, const std::string& content);

    /// @brief Read a whole file
    std::string read(const std::string& path) const;

    /// @brief List the immediate children of a directory ("." is the root)
    Listing list(const std::string& path) const;

    /// @brief True if the path exists; invalid paths still throw SandboxViolation
    bool exists(const std::string& path) const;

    /// @brief Absolute, checked location of a relative path
    std::filesystem::path resolve(const std::string& path) const;

private:
    std::filesystem::path root_;

    std::string relative(const std::filesystem::path& absolute) const;
};
