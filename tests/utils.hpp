#pragma once

#include "dtex.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dtex::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    struct scoped_env_var {
        std::string key{};
        std::optional<std::string> previous{};

        scoped_env_var(std::string key_value, std::optional<std::string> next) : key(std::move(key_value)) {
            if (auto* existing = std::getenv(key.c_str()); existing != nullptr) {
                previous = std::string{existing};
            }

            if (next) {
                REQUIRE(::setenv(key.c_str(), next->c_str(), 1) == 0);
            }
            else {
                REQUIRE(::unsetenv(key.c_str()) == 0);
            }
        }

        ~scoped_env_var() {
            if (previous) {
                (void)::setenv(key.c_str(), previous->c_str(), 1);
            }
            else {
                (void)::unsetenv(key.c_str());
            }
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());

        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    /*
     * Fake engine. Records its argv (one per line) in `args_path`, appends a line to
     * `count_path` per invocation, then runs `body` with $outdir and $name set from the
     * injected -output-directory and the trailing document argument.
     */
    inline fs::path make_stub_engine(
            const fs::path& dir, const fs::path& args_path, const fs::path& count_path, std::string_view body) {
        std::string script{};
        script.append("#!/usr/bin/env bash\n");
        script.append("set -eu\n");
        script.append("outdir=\"$2\"\n");
        script.append("doc=\"${@: -1}\"\n");
        script.append("name=\"$(basename \"$doc\" .tex)\"\n");
        script.append("printf '%s\\n' \"$@\" > \"").append(args_path.string()).append("\"\n");
        script.append("echo run >> \"").append(count_path.string()).append("\"\n");
        script.append(body);
        script.append("\n");

        auto path = dir / "fake-tex";
        make_executable_file(path, script);
        return path;
    }

    // aux grows on every run, so the artifacts never settle
    inline constexpr std::string_view unstable_engine_body =
            "echo \"\\\\relax pass\" >> \"$outdir/$name.aux\"\n"
            "echo '%PDF-1.5' > \"$outdir/$name.pdf\"";

    // same bytes every run: the second pass observes no change
    inline constexpr std::string_view stable_engine_body =
            "echo '\\relax' > \"$outdir/$name.aux\"\n"
            "echo 'toc' > \"$outdir/$name.toc\"\n"
            "echo '%PDF-1.5' > \"$outdir/$name.pdf\"\n"
            "echo \"log $(date +%s%N)\" > \"$outdir/$name.log\"";

    inline constexpr std::string_view failing_engine_body =
            "echo '! Undefined control sequence.'\n"
            "echo 'l.3 \\foo' 1>&2\n"
            "exit 1";

    inline size_t count_lines(const fs::path& path) {
        if (!fs::exists(path)) {
            return 0U;
        }
        return read_lines(path).size();
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }
}  // namespace dtex::test::detail
