#pragma once

#include "dtex/error.hpp"
#include "dtex/format.hpp"

extern "C" {
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace dtex::internal {

    using namespace dtex::literals;

    struct process_result {
        int exit_code{};
        std::string output{};
    };

    // Blocks until the child exits; stdout and stderr share one pipe so the output keeps
    // the interleaving the engine produced.
    inline result<process_result> run_process(const std::vector<std::string>& args) {
        if (args.empty()) {
            return io_error("cannot run an empty command");
        }

        int out_pipe[2]{};
        if (::pipe(out_pipe) != 0) {
            return io_error("pipe() failed: {}"_format(std::strerror(errno)));
        }

        auto pid = ::fork();
        if (pid < 0) {
            auto reason = std::strerror(errno);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            return io_error("fork() failed: {}"_format(reason));
        }

        if (pid == 0) {
            ::close(out_pipe[0]);
            if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(out_pipe[1], STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::close(out_pipe[1]);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        // parent
        ::close(out_pipe[1]);

        process_result proc{};
        char chunk[4096]{};
        for (;;) {
            auto n = ::read(out_pipe[0], chunk, sizeof(chunk));
            if (n > 0) {
                proc.output.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        ::close(out_pipe[0]);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return io_error("waitpid() failed: {}"_format(std::strerror(errno)));
            }
        }

        if (WIFEXITED(status)) {
            proc.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            proc.exit_code = 128 + WTERMSIG(status);
        }
        else {
            proc.exit_code = 1;
        }
        return proc;
    }

}  // namespace dtex::internal
