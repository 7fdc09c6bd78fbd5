#ifndef GHCLIENT_DISK_CACHE_HPP
#define GHCLIENT_DISK_CACHE_HPP

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "cache_storage.hpp"

namespace ghclient::cache {
    // Persistent storage: one file per URI under `root`, holding the URI, the
    // validator, the header snapshot and the body. Files are replaced with an
    // atomic rename, so readers see either the old or the new entry.
    class DiskCache : public ICacheStorage {
       public:
        explicit DiskCache(std::filesystem::path root);

        [[nodiscard]] std::optional<CacheKey> try_hit(const std::string &uri) const override;
        [[nodiscard]] std::optional<CachedResponse> load(const std::string &uri) const override;
        [[nodiscard]] std::unique_ptr<ICacheWriter> writer(const std::string &uri, CacheKey key, model::HeaderMap headers) override;

        [[nodiscard]] const std::filesystem::path &root() const { return root_; }

       private:
        struct Meta {
            std::string uri_;
            CacheKey key_;
            model::HeaderMap headers_;
        };

        class Writer;

        [[nodiscard]] std::filesystem::path entry_path(const std::string &uri) const;

        // Reads the meta section; leaves `in` positioned at the first body byte.
        static bool load_meta(std::istream &in, Meta &out);
        static std::string serialize(const Meta &m, std::string_view body);
        static void write_atomic(const std::filesystem::path &p, std::string_view bytes);

        std::filesystem::path root_;
    };
}  // namespace ghclient::cache

#endif
