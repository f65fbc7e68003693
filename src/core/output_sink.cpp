/**
 * dsPack Unpacker - Output Sink Implementation
 */

#include "dspack/output_sink.hpp"
#include "dspack/files.hpp"

namespace dspack {

std::filesystem::path DirectorySink::resolve(const std::string& relative_path) const {
    // Archive paths always use '/', the generic format keeps them portable
    return root_ / std::filesystem::path(relative_path, std::filesystem::path::generic_format);
}

Result<void> DirectorySink::create_directory(const std::string& relative_path) {
    return dspack::create_directories(resolve(relative_path));
}

Result<void> DirectorySink::write_file(const std::string& relative_path, std::span<const uint8_t> data) {
    auto target = resolve(relative_path);
    if (target.has_parent_path()) {
        DSPACK_TRY(dspack::create_directories(target.parent_path()));
    }
    return dspack::write_file(target, data);
}

} // namespace dspack
