#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

// Private scratch directory for one pipeline run. Everything inside is
// removed together with the directory when the workspace is destroyed, and
// so are the base directories create() had to make, once they are empty.
class TempWorkspace {
public:
    static std::expected<TempWorkspace, Error> create(const std::filesystem::path& base);

    ~TempWorkspace();

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;
    TempWorkspace(TempWorkspace&& other) noexcept;
    TempWorkspace& operator=(TempWorkspace&& other) noexcept;

    const std::filesystem::path& path() const { return dir_; }
    std::filesystem::path file(const std::string& name) const { return dir_ / name; }

    // Bytes available to an unprivileged writer on the workspace filesystem.
    std::expected<uint64_t, Error> available_bytes() const;

    void remove();

private:
    TempWorkspace(std::filesystem::path dir, std::vector<std::filesystem::path> created_bases)
        : dir_(std::move(dir)), created_bases_(std::move(created_bases)) {}

    std::filesystem::path dir_;
    std::vector<std::filesystem::path> created_bases_; // deepest first
};
