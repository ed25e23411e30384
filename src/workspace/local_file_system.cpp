#include "workspace/local_file_system.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace hive::workspace {

using core::errors::ErrorKind;
using core::errors::HiveError;

namespace {

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kSniffSize = 1024;
    char buffer[kSniffSize];
    in.read(buffer, static_cast<std::streamsize>(kSniffSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

}  // namespace

LocalFileSystem::LocalFileSystem(std::filesystem::path root, policy::PolicyGuard guard)
    : root_(std::move(root)), guard_(std::move(guard)) {}

core::errors::Result<std::filesystem::path> LocalFileSystem::resolve(
    const std::string& path) const {
    auto relative = guard_.validate_relative_path(path);
    if (core::errors::is_error(relative)) {
        return core::errors::get_error(relative);
    }
    return guard_.validate_path_in_workspace(root_, path);
}

core::errors::Result<bool> LocalFileSystem::exists(const std::string& path) const {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    std::error_code ec;
    const bool found = std::filesystem::is_regular_file(core::errors::get_value(resolved), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return HiveError{ErrorKind::Internal, "Unable to stat " + path + ": " + ec.message(),
                         "file_stat_failed"};
    }
    return found;
}

core::errors::Result<std::string> LocalFileSystem::read_file(const std::string& path) const {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return HiveError{ErrorKind::NotFound, "File does not exist: " + path, "file_not_found"};
    }
    if (is_probably_binary(file_path)) {
        return HiveError{ErrorKind::Input, "Refusing to read binary file: " + path,
                         "binary_file"};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return HiveError{ErrorKind::Internal, "Failed to open file: " + path, "file_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return HiveError{ErrorKind::Internal, "I/O error while reading file: " + path,
                         "file_read_failed"};
    }
    return buffer.str();
}

core::errors::Status LocalFileSystem::write_file(const std::string& path,
                                                 const std::string& content) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return HiveError{ErrorKind::Internal,
                         "Failed to create directory: " + file_path.parent_path().string(),
                         "directory_create_failed"};
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return HiveError{ErrorKind::Internal, "Failed to open file for writing: " + path,
                         "file_open_failed"};
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return HiveError{ErrorKind::Internal, "Failed to write file: " + path,
                         "file_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Status LocalFileSystem::remove_file(const std::string& path) {
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    std::error_code ec;
    std::filesystem::remove(core::errors::get_value(resolved), ec);
    if (ec) {
        return HiveError{ErrorKind::Internal, "Failed to remove file: " + path + ": " + ec.message(),
                         "file_remove_failed"};
    }
    return core::errors::ok();
}

}  // namespace hive::workspace
