#pragma once

#include <globstar/result.hpp>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace globstar {

// The filesystem operations the resolver is allowed to perform. Paths are
// passed through verbatim; an empty path is never listed (the resolver uses
// "." for the working directory).
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Names of the entries of `dir`, excluding "." and "..", in
    // enumeration order. Fails only if `dir` cannot be opened; a read error
    // after that ends the listing with the names read so far.
    virtual Result<std::vector<std::string>> list_dir(const std::string& dir) const = 0;

    // lexists semantics: a broken symlink exists.
    virtual bool exists(const std::string& path) const = 0;

    // Follows symlinks.
    virtual bool is_directory(const std::string& path) const = 0;

    virtual bool is_symlink(const std::string& path) const = 0;
};

// std::filesystem backed implementation. A directory handle is opened and
// closed within a single list_dir() call.
class LocalFileSystem : public FileSystem {
public:
    Result<std::vector<std::string>> list_dir(const std::string& dir) const override;
    bool exists(const std::string& path) const override;
    bool is_directory(const std::string& path) const override;
    bool is_symlink(const std::string& path) const override;
};

// Drain a directory_iterator-like range into entry names. Stops at the
// first failed increment, leaving the error in `ec`.
template<typename DirIter>
std::vector<std::string> read_entry_names(DirIter it, std::error_code& ec) {
    std::vector<std::string> names;
    for (DirIter end; it != end;) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) break;
    }
    return names;
}

// Shared default instance.
std::shared_ptr<const FileSystem> local_filesystem();

} // namespace globstar
