#pragma once

#include <string>
#include "core/errors/hive_errors.hpp"

namespace hive::protocol {

// File access used by branch merges and rollback. Paths are workspace
// relative.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual core::errors::Result<bool> exists(const std::string& path) const = 0;
    virtual core::errors::Result<std::string> read_file(const std::string& path) const = 0;
    virtual core::errors::Status write_file(const std::string& path,
                                            const std::string& content) = 0;
    virtual core::errors::Status remove_file(const std::string& path) = 0;
};

}  // namespace hive::protocol
