#pragma once

#include "error.hpp"
#include "workspace.hpp"

#include <filesystem>
#include <string_view>

namespace dtex {

    // <identity><ext>: the output lands beside the source document
    std::filesystem::path final_output_path(const document_identity& identity, std::string_view output_extension);

    // Single rename(2) of <ws.base><ext> to final_output_path(); no copy fallback
    result<std::filesystem::path> finalize_output(
            const workspace& ws, const document_identity& identity, std::string_view output_extension);

}  // namespace dtex
