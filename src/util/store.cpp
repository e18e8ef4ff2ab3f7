#include <dotkeep/store.hpp>
#include <dotkeep/log.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dotkeep {

namespace fs = std::filesystem;

Result<ConfigDocument> DocumentStore::read(const fs::path& path) const {
    auto text = read_text(path);
    if (text.is_err()) return std::move(text).error();
    return ConfigDocument::parse(text.value(), path.string());
}

Status DocumentStore::write(const ConfigDocument& doc, const fs::path& path) {
    return write_text(path, doc.to_string());
}

// ---------------------------------------------------------------------------
// FileStore
// ---------------------------------------------------------------------------

static DotkeepError io_error(const std::string& what, const fs::path& path, int err) {
    return DotkeepError{DotkeepError::IO,
        what + " '" + path.string() + "': " + std::strerror(err)};
}

namespace {

// Owns a temporary file descriptor and path. Unless committed, the file is
// closed and unlinked when the guard goes out of scope.
class TempFile {
public:
    TempFile(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}
    ~TempFile() {
        close_fd();
        if (!committed_) ::unlink(path_.c_str());
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    int fd() const { return fd_; }
    const fs::path& path() const { return path_; }

    int close_fd() {
        if (fd_ < 0) return 0;
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

    void commit() { committed_ = true; }

private:
    int fd_;
    fs::path path_;
    bool committed_ = false;
};

} // anonymous namespace

bool FileStore::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Result<std::string> FileStore::read_text(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return DotkeepError{DotkeepError::IO,
            "cannot open '" + path.string() + "' for reading"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return DotkeepError{DotkeepError::IO, "failed to read '" + path.string() + "'"};
    }
    return Result<std::string>::ok(ss.str());
}

Status FileStore::write_bytes(int fd, const std::string& data, const fs::path& tmp_path) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error("failed to write", tmp_path, errno);
        }
        written += static_cast<size_t>(n);
    }
    return ok_status();
}

Status FileStore::write_text(const fs::path& path, const std::string& text) {
    fs::path dir = path.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return DotkeepError{DotkeepError::IO,
            "cannot create directory '" + dir.string() + "': " + ec.message()};
    }

    std::string pattern = (dir / ("." + path.filename().string() + ".XXXXXX")).string();
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');

    int fd = ::mkstemp(tmpl.data());
    if (fd < 0) return io_error("cannot create temporary file in", dir, errno);

    TempFile tmp(fd, fs::path(tmpl.data()));

    // Keep the permissions of the file being replaced
    struct stat st;
    mode_t mode = (::stat(path.c_str(), &st) == 0) ? (st.st_mode & 07777) : 0644;
    if (::fchmod(tmp.fd(), mode) != 0) return io_error("cannot set mode of", tmp.path(), errno);

    DOTKEEP_TRY(write_bytes(tmp.fd(), text, tmp.path()));

    if (::fsync(tmp.fd()) != 0) return io_error("failed to sync", tmp.path(), errno);
    if (tmp.close_fd() != 0) return io_error("failed to close", tmp.path(), errno);

    if (::rename(tmp.path().c_str(), path.c_str()) != 0) {
        return io_error("failed to replace", path, errno);
    }
    tmp.commit();

    log::debug("wrote %zu bytes to '%s'", text.size(), path.c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// MemoryStore
// ---------------------------------------------------------------------------

bool MemoryStore::exists(const fs::path& path) const {
    return files_.count(path.lexically_normal()) > 0;
}

Result<std::string> MemoryStore::read_text(const fs::path& path) const {
    auto it = files_.find(path.lexically_normal());
    if (it == files_.end()) {
        return DotkeepError{DotkeepError::IO,
            "cannot open '" + path.string() + "' for reading"};
    }
    return Result<std::string>::ok(it->second);
}

Status MemoryStore::write_text(const fs::path& path, const std::string& text) {
    if (fail_writes_) {
        return DotkeepError{DotkeepError::IO,
            "failed to write '" + path.string() + "': simulated failure"};
    }
    files_[path.lexically_normal()] = text;
    ++write_count_;
    return ok_status();
}

void MemoryStore::put(const fs::path& path, std::string text) {
    files_[path.lexically_normal()] = std::move(text);
}

std::optional<std::string> MemoryStore::get(const fs::path& path) const {
    auto it = files_.find(path.lexically_normal());
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

} // namespace dotkeep
