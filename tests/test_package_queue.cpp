#include "package_queue.hpp"

#include <gtest/gtest.h>

using namespace dastore;

namespace {

PackageInfo make(const std::string &name) {
    PackageInfo pkg;
    pkg.name = name;
    return pkg;
}

} // anonymous namespace

TEST(PackageQueue, UniqueByName) {
    PackageQueue queue;
    EXPECT_TRUE(queue.add(make("vim")));
    EXPECT_TRUE(queue.add(make("git")));

    PackageInfo again = make("vim");
    again.version = "other";
    EXPECT_FALSE(queue.add(again));

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.names(), (std::vector<std::string>{"vim", "git"}));
    EXPECT_TRUE(queue.packages()[0].version.empty());
}

TEST(PackageQueue, RemoveAndClear) {
    PackageQueue queue;
    queue.add(make("vim"));
    queue.add(make("git"));

    EXPECT_TRUE(queue.remove("vim"));
    EXPECT_FALSE(queue.remove("vim"));
    EXPECT_FALSE(queue.contains("vim"));
    EXPECT_TRUE(queue.contains("git"));

    queue.clear();
    EXPECT_TRUE(queue.empty());
}

TEST(PackageQueue, NotifiesOnChangesOnly) {
    PackageQueue queue;
    int calls = 0;
    queue.add_listener([&calls]() { calls++; });

    queue.add(make("vim"));
    queue.add(make("vim"));
    queue.remove("missing");
    queue.remove("vim");
    queue.clear();

    EXPECT_EQ(calls, 2);
}

TEST(PackageQueue, RemovedListenerIsQuiet) {
    PackageQueue queue;
    int first = 0;
    int second = 0;
    unsigned id = queue.add_listener([&first]() { first++; });
    queue.add_listener([&second]() { second++; });

    queue.add(make("vim"));
    queue.remove_listener(id);
    queue.add(make("git"));

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);
}

TEST(PackageQueue, ListenerMayUnregisterItself) {
    PackageQueue queue;
    int calls = 0;
    unsigned id = 0;
    id = queue.add_listener([&]() {
        calls++;
        queue.remove_listener(id);
    });

    queue.add(make("vim"));
    queue.add(make("git"));

    EXPECT_EQ(calls, 1);
}
