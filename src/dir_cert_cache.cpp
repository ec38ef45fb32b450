#include "dir_cert_cache.hpp"
#include "errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace redirector {

namespace {

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Writes the whole buffer, retrying on short writes and EINTR.
bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

DirCertCache::DirCertCache(fs::path dir)
    : dir_(std::move(dir))
{}

fs::path DirCertCache::path_for(const std::string& key) const {
    if (key.empty() || key == "." || key == ".." || key.find('/') != std::string::npos ||
        key.find('\0') != std::string::npos) {
        throw StoreError("invalid cache key: " + key);
    }
    return dir_ / key;
}

std::string DirCertCache::get(const std::string& key, const RequestContext& ctx) {
    ctx.check();
    fs::path path = path_for(key);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            throw CacheMissError(key);
        }
        throw StoreError("cannot open " + path.string());
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StoreError("read failed for " + path.string());
    }
    return data;
}

void DirCertCache::put(const std::string& key, const std::string& data, const RequestContext& ctx) {
    ctx.check();
    fs::path target = path_for(key);

    std::error_code ec;
    bool created = fs::create_directories(dir_, ec);
    if (ec) {
        throw StoreError("cannot create " + dir_.string() + ": " + ec.message());
    }
    if (created) {
        fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            throw StoreError("cannot restrict " + dir_.string() + ": " + ec.message());
        }
    }

    std::string tmpl = (dir_ / "tmp-XXXXXX").string();
    std::vector<char> tmp_name(tmpl.begin(), tmpl.end());
    tmp_name.push_back('\0');

    // mkstemp creates the file with mode 0600.
    int fd = ::mkstemp(tmp_name.data());
    if (fd < 0) {
        throw StoreError(errno_text("cannot create temporary file in " + dir_.string()));
    }
    fs::path tmp_path(tmp_name.data());

    bool ok = write_all(fd, data);
    int saved_errno = errno;
    if (::close(fd) != 0 && ok) {
        ok = false;
        saved_errno = errno;
    }
    if (!ok) {
        fs::remove(tmp_path, ec);
        errno = saved_errno;
        throw StoreError(errno_text("write failed for " + target.string()));
    }

    if (ctx.done()) {
        fs::remove(tmp_path, ec);
        ctx.check();
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw StoreError("rename to " + target.string() + " failed: " + ec.message());
    }
}

void DirCertCache::remove(const std::string& key, const RequestContext& ctx) {
    ctx.check();
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        throw StoreError("remove failed for " + key + ": " + ec.message());
    }
}

} // namespace redirector
