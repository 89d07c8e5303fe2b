#include "common/error_handling.hpp"
#include "common/logger.hpp"

#include <utility>

namespace xcore {
namespace common {

ErrorHandler::ErrorCallback ErrorHandler::global_callback_;

void ErrorHandler::set_global_error_handler(ErrorCallback callback) {
    global_callback_ = std::move(callback);
}

void ErrorHandler::handle_error(const std::exception& e) {
    if (!global_callback_) {
        LOG_ERROR("Unhandled exception: {}", e.what());
        return;
    }
    global_callback_(e);
}

// The scope owns whatever handler was installed before it and puts it back
ErrorHandler::ErrorScope::ErrorScope(ErrorCallback callback)
    : previous_callback_(std::move(callback)) {
    std::swap(previous_callback_, global_callback_);
}

ErrorHandler::ErrorScope::~ErrorScope() {
    std::swap(previous_callback_, global_callback_);
}

} // namespace common
} // namespace xcore
