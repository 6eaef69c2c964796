#pragma once
#include <memory>
#include <string>

#include <geos_c.h>

namespace fogmap {

// reentrant な GEOS handle (GEOS_init_r) 1 つ分。handle は同時に 2 スレッドから
// 使えないので、各コンポーネントが自分の handle を持つ。
//
// notice / error は handle ごとに受ける。last_error() は直近のエラー文で、
// 呼び出し側が自分の warn に付け足す。
class GeosContext {
public:
    GeosContext();
    ~GeosContext();

    GeosContext(const GeosContext&) = delete;
    GeosContext& operator=(const GeosContext&) = delete;

    GEOSContextHandle_t handle() const { return handle_; }

    const std::string& last_error() const { return last_error_; }
    void clear_error() { last_error_.clear(); }

private:
    static void on_notice(const char* msg, void* userdata);
    static void on_error(const char* msg, void* userdata);

    GEOSContextHandle_t handle_ = nullptr;
    std::string last_error_;
};

using GeosContextPtr = std::shared_ptr<GeosContext>;

GeosContextPtr make_geos_context();

// GEOS geometry の所有ポインタ。deleter が生成元 context を geometry と
// 同じだけ生かしておく。
struct GeomDeleter {
    GeosContextPtr ctx;
    void operator()(GEOSGeometry* g) const {
        if (g) GEOSGeom_destroy_r(ctx->handle(), g);
    }
};

using GeomPtr = std::unique_ptr<GEOSGeometry, GeomDeleter>;

inline GeomPtr make_geom(const GeosContextPtr& ctx, GEOSGeometry* g) {
    return GeomPtr(g, GeomDeleter{ctx});
}

} // namespace fogmap
