#pragma once

#include <filesystem>
#include <string>
#include "policy/policy_guard.hpp"
#include "protocol/workspace_contract.hpp"

namespace hive::workspace {

// FileSystem over a real directory. Every path is resolved through the
// PolicyGuard, so nothing outside `root` is ever touched.
class LocalFileSystem final : public protocol::FileSystem {
public:
    explicit LocalFileSystem(std::filesystem::path root, policy::PolicyGuard guard = {});

    core::errors::Result<bool> exists(const std::string& path) const override;
    core::errors::Result<std::string> read_file(const std::string& path) const override;
    core::errors::Status write_file(const std::string& path, const std::string& content) override;
    core::errors::Status remove_file(const std::string& path) override;

    const std::filesystem::path& root() const { return root_; }

private:
    core::errors::Result<std::filesystem::path> resolve(const std::string& path) const;

    std::filesystem::path root_;
    policy::PolicyGuard guard_;
};

}  // namespace hive::workspace
