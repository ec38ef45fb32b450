#pragma once

#include <filesystem>
#include <string>

#include "cert_cache.hpp"

namespace redirector {

// Certificate store backed by one file per key in a local directory.
// Writes are atomic: data lands in a temporary file that is renamed into place.
class DirCertCache : public CertCache {
public:
    explicit DirCertCache(std::filesystem::path dir);

    std::string get(const std::string& key, const RequestContext& ctx) override;
    void put(const std::string& key, const std::string& data, const RequestContext& ctx) override;
    void remove(const std::string& key, const RequestContext& ctx) override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path dir_;
};

} // namespace redirector
