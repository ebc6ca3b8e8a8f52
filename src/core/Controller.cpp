#include "core/Controller.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"
#include "core/TypeKey.hpp"

namespace zen::core {

void Controller::initialize() {
    if (initialized_ || disposed_) {
        return;
    }
    onInit();
    // Only flip the flag once onInit() returned; a throwing onInit can be retried.
    initialized_ = true;
}

void Controller::markReady() {
    if (ready_ || disposed_) {
        return;
    }
    if (!initialized_) {
        initialize();
    }
    onReady();
    ready_ = true;
}

void Controller::addDisposer(std::function<void()> disposer) {
    if (disposed_) {
        LOG_WARN("addDisposer ignored on disposed controller " << readableTypeName(typeid(*this)));
        return;
    }
    disposers_.push_back(std::move(disposer));
}

void Controller::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;

    try {
        onClose();
    } catch (const std::exception& ex) {
        LOG_ERR("onClose failed for " << readableTypeName(typeid(*this)) << ": " << ex.what());
    } catch (...) {
        LOG_ERR("onClose failed for " << readableTypeName(typeid(*this)) << " with a non-standard exception");
    }

    auto disposers = std::move(disposers_);
    disposers_.clear();
    for (auto& disposer : disposers) {
        try {
            disposer();
        } catch (const std::exception& ex) {
            LOG_ERR("Controller disposer failed for " << readableTypeName(typeid(*this)) << ": "
                                                     << ex.what());
        } catch (...) {
            LOG_ERR("Controller disposer failed for " << readableTypeName(typeid(*this))
                                                     << " with a non-standard exception");
        }
    }

    LOG_DEBUG("Controller " << readableTypeName(typeid(*this)) << " disposed");
}

}  // namespace zen::core
