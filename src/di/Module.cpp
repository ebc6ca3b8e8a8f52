#include "di/Module.hpp"

namespace zen::di {

std::future<void> Module::onInit(Scope&) {
    return ready();
}

std::future<void> Module::onDispose(Scope&) {
    return ready();
}

std::future<void> Module::ready() {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

}  // namespace zen::di
