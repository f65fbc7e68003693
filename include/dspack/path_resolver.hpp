/**
 * dsPack Unpacker - Folder Path Resolver
 *
 * Turns per-folder parent indices into slash-joined paths. Results are
 * memoized, so resolving every folder costs O(folders) in total, and a
 * parent chain that loops back on itself is reported instead of followed.
 */

#pragma once

#include "types.hpp"
#include "result.hpp"
#include <vector>
#include <string>

namespace dspack {

class PathResolver {
public:
    explicit PathResolver(const std::vector<FolderEntry>& folders);

    /**
     * Full path of folder `index` ("Data/Textures").
     * Fails with CorruptArchive on a parent cycle, InvalidArgument on a bad index.
     */
    Result<std::string> resolve(int32_t index);

    /**
     * Resolve every folder; the returned vector is indexed like the folders.
     */
    Result<std::vector<std::string>> resolve_all();

    // Number of folders whose path was computed (not served from the memo)
    size_t resolution_steps() const { return steps_; }

private:
    enum class State : uint8_t {
        Unvisited,
        InProgress,
        Done
    };

    const std::vector<FolderEntry>& folders_;
    std::vector<std::string> paths_;
    std::vector<State> states_;
    size_t steps_ = 0;
};

} // namespace dspack
