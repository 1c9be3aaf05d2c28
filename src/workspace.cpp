#include "dtex/workspace.hpp"

#include "dtex/config.hpp"
#include "dtex/format.hpp"
#include "dtex/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace dtex::literals;

namespace dtex {

    document_identity make_document_identity(std::string_view document_arg) {
        std::string file{document_arg};
        if (fs::path{file}.extension() == source_extension) {
            file.resize(file.size() - source_extension.size());
        }

        std::error_code ec{};
        auto absolute = fs::absolute(fs::path{file}, ec);
        if (ec) {
            trace_log{"absolute path(", file, "): ", ec.message()};
            absolute = fs::path{file}.filename();
        }

        return document_identity{absolute.lexically_normal()};
    }

    fs::path workspace::artifact(std::string_view extension) const {
        auto path = base;
        path += extension;
        return path;
    }

    fs::path workspace_base_path(const fs::path& temp_root, const document_identity& identity) {
        // relative_path() drops the root name (volume) together with the root directory
        return temp_root / identity.path.relative_path();
    }

    result<workspace> resolve_workspace(const fs::path& temp_root, const document_identity& identity) {
        workspace ws{workspace_base_path(temp_root, identity)};

        std::error_code ec{};
        fs::create_directories(ws.dir(), ec);
        if (ec) {
            return io_error("create temporary directory ({}): {}"_format(ws.dir().string(), ec.message()));
        }

        trace_log{"workspace for ", identity.path.string(), ": ", ws.base.string()};
        return ws;
    }

    result<void> clean_temp_root(const fs::path& temp_root) {
        trace_log{"rm -r \"", temp_root.string(), "\""};

        std::error_code ec{};
        fs::remove_all(temp_root, ec);
        if (ec) {
            return io_error("clean temporary files ({}): {}"_format(temp_root.string(), ec.message()));
        }
        return {};
    }

    workspace_lock::workspace_lock(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

    workspace_lock::workspace_lock(workspace_lock&& other) noexcept
            : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

    workspace_lock& workspace_lock::operator=(workspace_lock&& other) noexcept {
        if (this != &other) {
            release();
            fd_ = std::exchange(other.fd_, -1);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    workspace_lock::~workspace_lock() {
        release();
    }

    void workspace_lock::release() {
        if (fd_ < 0) {
            return;
        }
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }

    result<workspace_lock> workspace_lock::acquire(const workspace& ws) {
        // leading '.' keeps the lock file out of the "<name>.*" artifact set
        auto lock_path = ws.dir() / ".{}.lock"_format(ws.name());

        int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            return io_error("failed to open lockfile ({}): {}"_format(lock_path.string(), std::strerror(errno)));
        }

        trace_log{"locking ", lock_path.string()};
        while (::flock(fd, LOCK_EX) != 0) {
            if (errno == EINTR) {
                continue;
            }
            auto reason = std::string{std::strerror(errno)};
            ::close(fd);
            return io_error("failed to lock ({}): {}"_format(lock_path.string(), reason));
        }

        return workspace_lock{fd, std::move(lock_path)};
    }

}  // namespace dtex
