#pragma once

#include "package.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace dastore {

// Packages waiting for a batch install, unique by name. Lives on the main
// loop; listeners run synchronously after each change.
class PackageQueue {
public:
    using Listener = std::function<void()>;

    // Returns false if a package with the same name is already queued.
    bool add(const PackageInfo &pkg);
    bool remove(const std::string &name);
    void clear();

    bool contains(const std::string &name) const;
    PackageList packages() const { return packages_; }
    std::vector<std::string> names() const;
    size_t size() const { return packages_.size(); }
    bool empty() const { return packages_.empty(); }

    // Returns an id for remove_listener().
    unsigned add_listener(Listener listener);
    void remove_listener(unsigned id);

private:
    void notify();

    PackageList packages_;
    std::vector<std::pair<unsigned, Listener>> listeners_;
    unsigned next_listener_id_ = 1;
};

} // namespace dastore
