#pragma once

#include <functional>
#include <string>

namespace captionist::status {

using Notifier = std::function<void(const std::string&)>;

// Logs message and hands it to the host's notifier, if one is installed.
void notify(const std::string& message);

// Installs a notifier for its lifetime; the one it replaced comes back afterwards.
class ScopedNotifier {
public:
    explicit ScopedNotifier(Notifier notifier);
    ~ScopedNotifier();

    ScopedNotifier(const ScopedNotifier&) = delete;
    ScopedNotifier& operator=(const ScopedNotifier&) = delete;

private:
    Notifier previous_;
};

}
