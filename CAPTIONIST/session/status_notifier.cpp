#include "status_notifier.hpp"

#include <mutex>
#include <utility>

#include "utils/log.hpp"

namespace captionist::status {

namespace {

struct Installed {
    std::mutex mutex;
    Notifier notifier;
};

Installed& installed() {
    static Installed slot;
    return slot;
}

Notifier exchange(Notifier next) {
    Installed& slot = installed();
    std::lock_guard<std::mutex> lock(slot.mutex);
    std::swap(slot.notifier, next);
    return next;
}

}

void notify(const std::string& message) {
    if (message.empty()) {
        return;
    }
    log::info("[Status] " + message);
    Notifier current;
    {
        Installed& slot = installed();
        std::lock_guard<std::mutex> lock(slot.mutex);
        current = slot.notifier;
    }
    if (current) {
        current(message);
    }
}

ScopedNotifier::ScopedNotifier(Notifier notifier)
: previous_(exchange(std::move(notifier))) {}

ScopedNotifier::~ScopedNotifier() {
    exchange(std::move(previous_));
}

}
