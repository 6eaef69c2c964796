#include <fogmap/persistence.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fogmap/log.hpp>

namespace fs = std::filesystem;

namespace fogmap {

// ---------- codec ----------

PersistenceCodec::PersistenceCodec() : ctx_(make_geos_context()) {}

Bytes PersistenceCodec::encode(const Region& region) const {
    std::lock_guard<std::mutex> lock(mutex_);
    GEOSContextHandle_t h = ctx_->handle();

    GeomPtr empty;
    const GEOSGeometry* g = region.geometry();
    if (!g) {
        empty = make_geom(ctx_, GEOSGeom_createEmptyPolygon_r(h));
        g = empty.get();
    }
    if (!g) return {};

    GEOSWKBWriter* w = GEOSWKBWriter_create_r(h);
    if (!w) return {};
    GEOSWKBWriter_setByteOrder_r(h, w, GEOS_WKB_NDR);
    GEOSWKBWriter_setOutputDimension_r(h, w, 2);

    std::size_t size = 0;
    unsigned char* buf = GEOSWKBWriter_write_r(h, w, g, &size);
    GEOSWKBWriter_destroy_r(h, w);

    if (!buf) {
        log_warn("GEOSWKBWriter_write_r failed: " + ctx_->last_error());
        return {};
    }
    Bytes out(buf, buf + size);
    GEOSFree_r(h, buf);
    return out;
}

std::optional<Region> PersistenceCodec::decode(const Bytes& bytes) const {
    if (bytes.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    GEOSContextHandle_t h = ctx_->handle();
    GEOSWKBReader* r = GEOSWKBReader_create_r(h);
    if (!r) return std::nullopt;

    ctx_->clear_error();
    GeomPtr g = make_geom(ctx_, GEOSWKBReader_read_r(h, r, bytes.data(), bytes.size()));
    GEOSWKBReader_destroy_r(h, r);

    if (!g) {
        log_warn("WKB snapshot unreadable: " + ctx_->last_error());
        return std::nullopt;
    }

    const int type = GEOSGeomTypeId_r(h, g.get());
    if (type != GEOS_POLYGON && type != GEOS_MULTIPOLYGON) {
        log_warn("WKB snapshot is not polygonal (type id " + std::to_string(type) + ")");
        return std::nullopt;
    }
    // 自己交差・重なりのある region に union を重ねると壊れるので、読み込み時点で弾く
    if (GEOSisValid_r(h, g.get()) != 1) {
        log_warn("WKB snapshot is not a valid polygon " + ctx_->last_error());
        return std::nullopt;
    }
    return Region::adopt(std::move(g));
}

// ---------- store ----------

SnapshotStore::SnapshotStore(std::string path) : path_(std::move(path)) {}

LoadResult SnapshotStore::load() const {
    LoadResult res;

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
        res.status = LoadStatus::missing;
        res.error = "no snapshot at " + path_;
        return res;
    }

    const Bytes bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        res.status = LoadStatus::corrupt;
        res.error = "read error on " + path_;
        log_warn(res.error);
        return res;
    }

    std::optional<Region> region = codec_.decode(bytes);
    if (!region) {
        res.status = LoadStatus::corrupt;
        res.error = "snapshot " + path_ + " is malformed (" + std::to_string(bytes.size()) + " bytes)";
        log_warn(res.error);
        return res;
    }

    res.status = LoadStatus::loaded;
    res.region = std::move(*region);
    return res;
}

static void throw_if_disk_full(int err, const std::string& what) {
    if (err == ENOSPC || err == EDQUOT) {
        throw std::system_error(err, std::generic_category(), what);
    }
}

SaveResult SnapshotStore::save(const Region& region) const {
    SaveResult res;

    const Bytes bytes = codec_.encode(region);
    if (bytes.empty()) {
        res.ok = false;
        res.error = "failed to encode region";
        log_warn(res.error);
        return res;
    }

    const std::string tmp = path_ + ".tmp";
    auto fail = [&](const std::string& why, int err) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw_if_disk_full(err, "save " + path_);
        res.ok = false;
        res.error = why + ": " + std::strerror(err);
        log_warn(res.error);
        return res;
    };

    std::FILE* fp = std::fopen(tmp.c_str(), "wb");
    if (!fp) {
        const int err = errno;
        return fail("cannot open " + tmp, err);
    }

    errno = 0;
    const std::size_t n = std::fwrite(bytes.data(), 1, bytes.size(), fp);
    const int write_err = errno;
    if (n != bytes.size()) {
        std::fclose(fp);
        return fail("short write to " + tmp, write_err ? write_err : EIO);
    }
    if (std::fflush(fp) != 0) {
        const int err = errno;
        std::fclose(fp);
        return fail("flush failed on " + tmp, err);
    }
    if (std::fclose(fp) != 0) {
        const int err = errno;
        return fail("close failed on " + tmp, err);
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) return fail("rename " + tmp + " -> " + path_ + " failed", ec.value());

    res.bytes_written = bytes.size();
    return res;
}

} // namespace fogmap
