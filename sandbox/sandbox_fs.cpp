#include "dirgen.h"
#include "sandbox/sandbox_fs.h"

#include <fstream>
#include <sstream>
#include <algorithm>

namespace fs = std::filesystem;

SandboxFilesystem::SandboxFilesystem(const std::string& root) {
    if (root.empty()) {
        throw SandboxViolation("Sandbox root must not be empty");
    }
    fs::create_directories(root);
    root_ = fs::canonical(root);
    LOG_INFO("Sandbox root: " + root_.string());
}

fs::path SandboxFilesystem::resolve(const std::string& path) const {
    if (path.empty()) {
        throw SandboxViolation("Invalid or unsafe path: empty");
    }

    fs::path requested(path);
    if (requested.is_absolute() || requested.has_root_name() || requested.has_root_directory()) {
        throw SandboxViolation("Invalid or unsafe path: " + path);
    }
    for (const auto& part : requested) {
        if (part == "..") {
            throw SandboxViolation("Invalid or unsafe path: " + path);
        }
    }

    fs::path resolved = fs::weakly_canonical(root_ / requested);

    // Component-wise prefix check so "/root-other" does not match "/root"
    auto mismatch = std::mismatch(root_.begin(), root_.end(), resolved.begin(), resolved.end());
    if (mismatch.first != root_.end()) {
        throw SandboxViolation("Path outside the project sandbox: " + path);
    }
    return resolved;
}

std::string SandboxFilesystem::relative(const fs::path& absolute) const {
    return absolute.lexically_relative(root_).generic_string();
}

void SandboxFilesystem::write(const std::string& path, const std::string& content) {
    fs::path target = resolve(path);
    if (target == root_) {
        throw SandboxViolation("Cannot write to the sandbox root");
    }

    fs::create_directories(target.parent_path());

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open for writing: " + path);
    }
    file << content;
    if (!file.good()) {
        throw std::runtime_error("Failed to write: " + path);
    }
    dprintf(2, "Wrote %s (%zu bytes)", path.c_str(), content.size());
}

std::string SandboxFilesystem::read(const std::string& path) const {
    fs::path target = resolve(path);
    if (!fs::exists(target)) {
        throw SandboxNotFound("File not found: " + path);
    }
    if (fs::is_directory(target)) {
        throw SandboxNotFound("Not a file: " + path);
    }

    std::ifstream file(target, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open for reading: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

SandboxFilesystem::Listing SandboxFilesystem::list(const std::string& path) const {
    fs::path target = resolve(path);
    if (!fs::exists(target)) {
        throw SandboxNotFound("Directory not found: " + path);
    }
    if (!fs::is_directory(target)) {
        throw SandboxNotFound("Not a directory: " + path);
    }

    Listing listing;
    for (const auto& entry : fs::directory_iterator(target)) {
        if (entry.is_directory()) {
            listing.dirs.push_back(relative(entry.path()));
        } else if (entry.is_regular_file()) {
            listing.files.push_back(relative(entry.path()));
        }
    }
    std::sort(listing.files.begin(), listing.files.end());
    std::sort(listing.dirs.begin(), listing.dirs.end());
    return listing;
}

bool SandboxFilesystem::exists(const std::string& path) const {
    return fs::exists(resolve(path));
}
