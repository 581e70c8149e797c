#include "media/workspace.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <stdlib.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

void remove_empty(const std::vector<fs::path>& dirs) {
    for (auto& d : dirs) {
        std::error_code ec;
        if (!fs::is_directory(d, ec) || !fs::is_empty(d, ec) || ec) break;
        fs::remove(d, ec);
        if (ec) break;
    }
}

} // namespace

std::expected<TempWorkspace, Error> TempWorkspace::create(const fs::path& base) {
    std::error_code ec;
    std::vector<fs::path> created;
    for (auto p = base; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
        created.push_back(p);
        if (p == p.parent_path()) break;
    }
    fs::create_directories(base, ec);
    if (ec) {
        auto err = Error{ErrorKind::DiskSpace,
            "cannot create temp dir " + base.string() + ": " + ec.message()};
        remove_empty(created);
        return std::unexpected(std::move(err));
    }

    auto tmpl_str = (base / "run-XXXXXX").string();
    std::vector<char> tmpl(tmpl_str.begin(), tmpl_str.end());
    tmpl.push_back('\0');
    if (!::mkdtemp(tmpl.data())) {
        auto err = Error{ErrorKind::DiskSpace,
            std::string("mkdtemp() failed: ") + std::strerror(errno)};
        remove_empty(created);
        return std::unexpected(std::move(err));
    }
    return TempWorkspace(fs::path(tmpl.data()), std::move(created));
}

TempWorkspace::~TempWorkspace() {
    remove();
}

TempWorkspace::TempWorkspace(TempWorkspace&& other) noexcept
    : dir_(std::move(other.dir_)), created_bases_(std::move(other.created_bases_)) {
    other.dir_.clear();
    other.created_bases_.clear();
}

TempWorkspace& TempWorkspace::operator=(TempWorkspace&& other) noexcept {
    if (this != &other) {
        remove();
        dir_ = std::move(other.dir_);
        created_bases_ = std::move(other.created_bases_);
        other.dir_.clear();
        other.created_bases_.clear();
    }
    return *this;
}

std::expected<uint64_t, Error> TempWorkspace::available_bytes() const {
    std::error_code ec;
    auto info = fs::space(dir_, ec);
    if (ec) {
        return std::unexpected(Error{ErrorKind::DiskSpace,
            "cannot query free space of " + dir_.string() + ": " + ec.message()});
    }
    return static_cast<uint64_t>(info.available);
}

void TempWorkspace::remove() {
    if (dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        std::println(stderr, "workspace: failed to remove {}: {}", dir_.string(), ec.message());
    }
    dir_.clear();

    // Another run may still be using the base; a non-empty one stays.
    remove_empty(created_bases_);
    created_bases_.clear();
}
