#pragma once

#include "error.hpp"
#include "workspace.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace dtex {

    inline constexpr uint64_t fnv1a_64_offset_basis = 0xcbf29ce484222325ULL;
    inline constexpr uint64_t fnv1a_64_prime = 0x100000001b3ULL;

    // Pass the previous result as `seed` to hash a stream chunk by chunk
    constexpr uint64_t fnv1a_64(std::string_view bytes, uint64_t seed = fnv1a_64_offset_basis) {
        auto hash = seed;
        for (auto c : bytes) {
            hash ^= static_cast<uint8_t>(c);
            hash *= fnv1a_64_prime;
        }
        return hash;
    }

    result<uint64_t> hash_file(const std::filesystem::path& path);

    /*
     * Content-hash snapshot of the engine artifacts in one workspace.
     *
     * Tracked files are regular files in ws.dir() named "<ws.name()>.*", minus the output
     * artifact and the engine log. Hashes are only ever added or overwritten: a file that
     * disappears keeps its last recorded hash.
     */
    class convergence_tracker {
      public:
        using snapshot = std::map<std::filesystem::path, uint64_t>;

        // Takes the initial snapshot, then reports changed() regardless of its outcome
        static result<convergence_tracker> create(workspace ws, std::string output_extension);

        result<void> update();

        bool changed() const { return changed_; }
        const snapshot& hashes() const { return hashes_; }
        const workspace& tracked_workspace() const { return ws_; }

        bool is_tracked(const std::filesystem::path& file) const;

      private:
        convergence_tracker(workspace ws, std::string output_extension);

        workspace ws_{};
        std::string output_extension_{};
        snapshot hashes_{};
        bool changed_{true};
    };

}  // namespace dtex
