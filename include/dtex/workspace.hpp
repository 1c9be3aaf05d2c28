#pragma once

#include "error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace dtex {

    // Absolute, lexically normal path of the document with ".tex" removed
    struct document_identity {
        std::filesystem::path path{};

        std::string name() const { return path.filename().string(); }
    };

    document_identity make_document_identity(std::string_view document_arg);

    struct workspace {
        // <temp_root>/<identity without volume>; artifacts are `base` + extension
        std::filesystem::path base{};

        std::filesystem::path dir() const { return base.parent_path(); }
        std::string name() const { return base.filename().string(); }
        std::filesystem::path artifact(std::string_view extension) const;
    };

    std::filesystem::path workspace_base_path(
            const std::filesystem::path& temp_root, const document_identity& identity);

    result<workspace> resolve_workspace(const std::filesystem::path& temp_root, const document_identity& identity);

    result<void> clean_temp_root(const std::filesystem::path& temp_root);

    // Exclusive flock() on <dir>/.<name>.lock, held until destruction
    class workspace_lock {
      public:
        workspace_lock() = default;
        workspace_lock(const workspace_lock&) = delete;
        workspace_lock& operator=(const workspace_lock&) = delete;
        workspace_lock(workspace_lock&& other) noexcept;
        workspace_lock& operator=(workspace_lock&& other) noexcept;
        ~workspace_lock();

        static result<workspace_lock> acquire(const workspace& ws);

        bool held() const { return fd_ >= 0; }
        const std::filesystem::path& path() const { return path_; }

      private:
        workspace_lock(int fd, std::filesystem::path path);
        void release();

        int fd_{-1};
        std::filesystem::path path_{};
    };

}  // namespace dtex
