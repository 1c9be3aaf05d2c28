#include "dtex/finalizer.hpp"

#include "dtex/format.hpp"
#include "dtex/utils.hpp"

#include <system_error>

namespace fs = std::filesystem;
using namespace dtex::literals;

namespace dtex {

    fs::path final_output_path(const document_identity& identity, std::string_view output_extension) {
        auto path = identity.path;
        path += output_extension;
        return path;
    }

    result<fs::path> finalize_output(
            const workspace& ws, const document_identity& identity, std::string_view output_extension) {
        auto source = ws.artifact(output_extension);
        auto target = final_output_path(identity, output_extension);

        trace_log{"mv ", source.string(), " ", target.string()};
        std::error_code ec{};
        fs::rename(source, target, ec);
        if (ec) {
            return io_error(
                    "move resulting {} into place ({} -> {}): {}"_format(
                            output_extension, source.string(), target.string(), ec.message()));
        }
        return target;
    }

}  // namespace dtex
