#include "package_queue.hpp"

#include <algorithm>

namespace dastore {

bool PackageQueue::add(const PackageInfo &pkg) {
    if (contains(pkg.name)) {
        return false;
    }
    packages_.push_back(pkg);
    notify();
    return true;
}

bool PackageQueue::remove(const std::string &name) {
    auto it = std::remove_if(packages_.begin(), packages_.end(),
                             [&name](const PackageInfo &p) { return p.name == name; });
    if (it == packages_.end()) {
        return false;
    }
    packages_.erase(it, packages_.end());
    notify();
    return true;
}

void PackageQueue::clear() {
    if (packages_.empty()) return;
    packages_.clear();
    notify();
}

bool PackageQueue::contains(const std::string &name) const {
    return std::any_of(packages_.begin(), packages_.end(),
                       [&name](const PackageInfo &p) { return p.name == name; });
}

std::vector<std::string> PackageQueue::names() const {
    std::vector<std::string> out;
    out.reserve(packages_.size());
    for (const auto &pkg : packages_) {
        out.push_back(pkg.name);
    }
    return out;
}

unsigned PackageQueue::add_listener(Listener listener) {
    unsigned id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void PackageQueue::remove_listener(unsigned id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const std::pair<unsigned, Listener> &l) {
                                        return l.first == id;
                                    }),
                     listeners_.end());
}

void PackageQueue::notify() {
    // Copy: a listener may unregister itself (a dialog closing).
    auto listeners = listeners_;
    for (auto &listener : listeners) {
        listener.second();
    }
}

} // namespace dastore
