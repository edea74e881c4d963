#include <globstar/filesystem.hpp>
#include <globstar/log.hpp>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace globstar {

Result<std::vector<std::string>> LocalFileSystem::list_dir(const std::string& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        auto code = (ec == std::errc::no_such_file_or_directory)
            ? GlobError::NotFound : GlobError::IO;
        return GlobError{code, "cannot list directory '" + dir + "': " + ec.message()};
    }

    std::vector<std::string> names = read_entry_names(std::move(it), ec);
    if (ec) {
        log::debug("listing of '%s' stopped after %zu entries: %s",
                   dir.c_str(), names.size(), ec.message().c_str());
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

bool LocalFileSystem::exists(const std::string& path) const {
    if (path.empty()) return false;
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool LocalFileSystem::is_directory(const std::string& path) const {
    if (path.empty()) return false;
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool LocalFileSystem::is_symlink(const std::string& path) const {
    if (path.empty()) return false;
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

std::shared_ptr<const FileSystem> local_filesystem() {
    static auto instance = std::make_shared<const LocalFileSystem>();
    return instance;
}

} // namespace globstar
