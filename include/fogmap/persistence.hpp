#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <fogmap/geos_context.hpp>
#include <fogmap/region.hpp>

namespace fogmap {

using Bytes = std::vector<std::uint8_t>;

// Region <-> WKB（little-endian, 2D）。空の region は POLYGON EMPTY として
// 書くので、スナップショットは常に読める geometry になる。
class PersistenceCodec {
public:
    PersistenceCodec();

    // GEOS writer が失敗したら空の Bytes（warn あり）
    Bytes encode(const Region& region) const;

    // 空入力 / 読めない WKB / polygon 以外 / invalid（自己交差リング、
    // 重なった part）は nullopt。
    std::optional<Region> decode(const Bytes& bytes) const;

private:
    GeosContextPtr ctx_;
    mutable std::mutex mutex_;
};

enum class LoadStatus { loaded, missing, corrupt };

struct LoadResult {
    LoadStatus status = LoadStatus::missing;
    Region region;
    std::string error;
};

struct SaveResult {
    bool ok = true;
    std::size_t bytes_written = 0;
    std::string error;
};

// 単一ファイルのスナップショット保存。
//
// save() は "<path>.tmp" に書いてから <path> へ rename する。失敗しても前の
// スナップショットは残る。ディスクフルだけは warn ではなく std::system_error。
class SnapshotStore {
public:
    explicit SnapshotStore(std::string path);

    LoadResult load() const;
    SaveResult save(const Region& region) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    PersistenceCodec codec_;
};

} // namespace fogmap
