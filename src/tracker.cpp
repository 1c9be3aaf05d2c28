#include "dtex/tracker.hpp"

#include "dtex/config.hpp"
#include "dtex/format.hpp"
#include "dtex/utils.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace dtex::literals;

namespace dtex {

    result<uint64_t> hash_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return io_error("open file ({}): failed to open for reading"_format(path.string()));
        }

        auto hash = fnv1a_64_offset_basis;
        std::array<char, 8192> chunk{};
        while (in) {
            in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            auto n = in.gcount();
            if (n > 0) {
                hash = fnv1a_64(std::string_view{chunk.data(), static_cast<size_t>(n)}, hash);
            }
        }
        if (in.bad()) {
            return io_error("read file ({}): stream error"_format(path.string()));
        }
        return hash;
    }

    convergence_tracker::convergence_tracker(workspace ws, std::string output_extension)
            : ws_(std::move(ws)), output_extension_(std::move(output_extension)) {}

    result<convergence_tracker> convergence_tracker::create(workspace ws, std::string output_extension) {
        convergence_tracker tracker{std::move(ws), std::move(output_extension)};
        trace_log{"computing initial hashes of ", tracker.ws_.base.string()};
        if (auto res = tracker.update(); !res) {
            return std::unexpected{res.error()};
        }
        // artifacts left over from an earlier run must not skip the first pass
        tracker.changed_ = true;
        return tracker;
    }

    bool convergence_tracker::is_tracked(const fs::path& file) const {
        auto filename = file.filename().string();
        auto prefix = ws_.name() + '.';
        if (!filename.starts_with(prefix)) {
            return false;
        }
        auto extension = file.extension().string();
        return extension != output_extension_ && extension != log_extension;
    }

    result<void> convergence_tracker::update() {
        std::vector<fs::path> files{};

        std::error_code ec{};
        for (fs::directory_iterator it{ws_.dir(), ec}, end{}; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec{};
            if (!it->is_regular_file(type_ec) || !is_tracked(it->path())) {
                continue;
            }
            files.push_back(it->path());
        }
        if (ec) {
            return io_error("list artifacts ({}): {}"_format(ws_.dir().string(), ec.message()));
        }
        std::ranges::sort(files);

        changed_ = false;
        for (const auto& file : files) {
            auto id = hash_file(file);
            if (!id) {
                return std::unexpected{id.error()};
            }
            trace_log{"hashing ", file.string(), " -> ", *id};

            auto it = hashes_.find(file);
            if (it == hashes_.end() || it->second != *id) {
                trace_log{"  file changed"};
                changed_ = true;
            }
            hashes_[file] = *id;
        }
        return {};
    }

}  // namespace dtex
