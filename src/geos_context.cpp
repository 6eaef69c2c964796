#include <fogmap/geos_context.hpp>

#include <stdexcept>

#include <fogmap/log.hpp>

namespace fogmap {

// GEOSMessageHandler_r: void (*)(const char* message, void* userdata)
void GeosContext::on_notice(const char* msg, void* /*userdata*/) {
    if (msg) log_info(std::string("GEOS: ") + msg);
}

void GeosContext::on_error(const char* msg, void* userdata) {
    auto* self = static_cast<GeosContext*>(userdata);
    if (self) self->last_error_ = msg ? msg : "unknown GEOS error";
}

GeosContext::GeosContext() {
    handle_ = GEOS_init_r();
    if (!handle_) throw std::runtime_error("GEOS_init_r failed");

    GEOSContext_setNoticeMessageHandler_r(handle_, &GeosContext::on_notice, this);
    GEOSContext_setErrorMessageHandler_r(handle_, &GeosContext::on_error, this);
}

GeosContext::~GeosContext() {
    if (handle_) GEOS_finish_r(handle_);
}

GeosContextPtr make_geos_context() {
    return std::make_shared<GeosContext>();
}

} // namespace fogmap
