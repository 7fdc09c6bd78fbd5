#include "disk_cache.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "../utils/string_utils.hpp"

static constexpr const char *ENTRY_FILE_EXT = ".entry";
static constexpr const char *TMP_FILE_EXT = ".tmp";

namespace ghclient::cache {
    struct MetaKeys {
        static constexpr const char *URI = "uri";
        static constexpr const char *KEY_KIND = "key_kind";
        static constexpr const char *KEY = "key";
        static constexpr const char *HEADER = "header";
        static constexpr const char *ETAG_KIND = "etag";
        static constexpr const char *LAST_MODIFIED_KIND = "last_modified";
    };

    class DiskCache::Writer : public ICacheWriter {
       public:
        Writer(std::filesystem::path path, Meta meta) : path_(std::move(path)), meta_(std::move(meta)) {}

        void write_body(std::string_view data) override { body_.append(data); }

        void commit() override {
            if (committed_) {
                return;
            }
            committed_ = true;
            write_atomic(path_, serialize(meta_, body_));
        }

       private:
        std::filesystem::path path_;
        Meta meta_;
        std::string body_;
        bool committed_ = false;
    };

    DiskCache::DiskCache(std::filesystem::path root) : root_(std::move(root)) { std::filesystem::create_directories(root_); }

    std::filesystem::path DiskCache::entry_path(const std::string &uri) const {
        std::hash<std::string> hash_maker;
        // IMPROVEMENT (out of scope): Include Vary request headers in the key.
        size_t hash = hash_maker(uri);
        return root_ / (std::to_string(hash) + ENTRY_FILE_EXT);
    }

    std::optional<CacheKey> DiskCache::try_hit(const std::string &uri) const {
        std::ifstream in(entry_path(uri), std::ios::binary);
        if (!in) {
            return std::nullopt;
        }
        Meta meta;
        // A different URI hashing to the same file is a miss.
        if (!load_meta(in, meta) || meta.uri_ != uri) {
            return std::nullopt;
        }
        return meta.key_;
    }

    std::optional<CachedResponse> DiskCache::load(const std::string &uri) const {
        std::ifstream in(entry_path(uri), std::ios::binary);
        if (!in) {
            return std::nullopt;
        }
        Meta meta;
        if (!load_meta(in, meta) || meta.uri_ != uri) {
            return std::nullopt;
        }
        CachedResponse out;
        out.headers_ = std::move(meta.headers_);
        out.body_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return out;
    }

    std::unique_ptr<ICacheWriter> DiskCache::writer(const std::string &uri, CacheKey key, model::HeaderMap headers) {
        return std::make_unique<Writer>(entry_path(uri), Meta{.uri_ = uri, .key_ = std::move(key), .headers_ = std::move(headers)});
    }

    std::string DiskCache::serialize(const Meta &m, std::string_view body) {
        std::ostringstream oss;
        oss << MetaKeys::URI << ": " << m.uri_ << "\n"
            << MetaKeys::KEY_KIND << ": " << (m.key_.kind_ == CacheKey::Kind::ETAG ? MetaKeys::ETAG_KIND : MetaKeys::LAST_MODIFIED_KIND) << "\n"
            << MetaKeys::KEY << ": " << m.key_.value_ << "\n";
        for (const auto &[name, value] : m.headers_) {
            oss << MetaKeys::HEADER << ": " << name << ": " << value << "\n";
        }
        oss << "\n";
        oss.write(body.data(), static_cast<std::streamsize>(body.size()));
        return oss.str();
    }

    void DiskCache::write_atomic(const std::filesystem::path &p, std::string_view bytes) {
        static std::atomic<unsigned long long> sequence{0};

        auto tmp = p;
        tmp += "." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "." + std::to_string(sequence++) + TMP_FILE_EXT;
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }
        std::filesystem::rename(tmp, p);  // atomic on same filesystem
    }

    bool DiskCache::load_meta(std::istream &in, Meta &out) {
        std::string line;
        bool has_uri = false;
        bool has_key = false;

        while (std::getline(in, line)) {
            if (line.empty()) {
                return has_uri && has_key;
            }
            auto pos = line.find(':');
            if (pos == std::string::npos) {
                continue;
            }
            std::string key = string_utils::trim(line.substr(0, pos));
            std::string val = string_utils::trim(line.substr(pos + 1));
            if (key == MetaKeys::URI) {
                out.uri_ = val;
                has_uri = true;
            } else if (key == MetaKeys::KEY_KIND) {
                out.key_.kind_ = val == MetaKeys::LAST_MODIFIED_KIND ? CacheKey::Kind::LAST_MODIFIED : CacheKey::Kind::ETAG;
            } else if (key == MetaKeys::KEY) {
                out.key_.value_ = val;
                has_key = !val.empty();
            } else if (key == MetaKeys::HEADER) {
                if (auto field = model::HeaderMap::parse_line(val)) {
                    out.headers_.append(std::move(field->first), std::move(field->second));
                }
            }
        }
        // No separator line: truncated entry.
        return false;
    }
}  // namespace ghclient::cache
