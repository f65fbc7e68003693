/**
 * dsPack Unpacker - Folder Path Resolver Implementation
 */

#include "dspack/path_resolver.hpp"
#include "dspack/logging.hpp"

namespace dspack {

PathResolver::PathResolver(const std::vector<FolderEntry>& folders)
    : folders_(folders),
      paths_(folders.size()),
      states_(folders.size(), State::Unvisited) {}

Result<std::string> PathResolver::resolve(int32_t index) {
    if (index < 0 || static_cast<size_t>(index) >= folders_.size()) {
        return Error(Error::Code::InvalidArgument,
                     "Folder index " + std::to_string(index) + " out of range (" +
                     std::to_string(folders_.size()) + " folders)");
    }
    if (states_[index] == State::Done) {
        return paths_[index];
    }

    // Walk up until a root or an already resolved ancestor
    std::vector<int32_t> chain;
    int32_t current = index;
    while (current != NO_INDEX && states_[current] != State::Done) {
        if (states_[current] == State::InProgress) {
            for (int32_t pending : chain) {
                states_[pending] = State::Unvisited;
            }
            return Error::corrupt_archive("Folder parent chain forms a cycle at folder " +
                                          std::to_string(current) + " (resolving folder " +
                                          std::to_string(index) + ")");
        }

        states_[current] = State::InProgress;
        chain.push_back(current);

        int32_t parent = folders_[current].parent_folder;
        if (parent != NO_INDEX && (parent < 0 || static_cast<size_t>(parent) >= folders_.size())) {
            for (int32_t pending : chain) {
                states_[pending] = State::Unvisited;
            }
            return Error::integrity("Invalid parent folder " + std::to_string(parent) +
                                    " for folder " + std::to_string(current));
        }
        current = parent;
    }

    // Ancestors first, so every parent path is ready when its child needs it
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const FolderEntry& folder = folders_[*it];
        if (folder.is_root()) {
            paths_[*it] = folder.name;
        } else {
            paths_[*it] = paths_[folder.parent_folder] + "/" + folder.name;
        }
        states_[*it] = State::Done;
        ++steps_;
    }

    return paths_[index];
}

Result<std::vector<std::string>> PathResolver::resolve_all() {
    for (size_t i = 0; i < folders_.size(); ++i) {
        DSPACK_TRY(resolve(static_cast<int32_t>(i)));
    }
    LOG_DEBUG("PathResolver", "Resolved " << folders_.size() << " folder paths in "
              << steps_ << " steps");
    return paths_;
}

} // namespace dspack
