// tests/test_config_store.cpp
// @brief Verify snapshot publication in ConfigStore.
// @invariant Readers always see a complete snapshot; never null.
// @ownership Test owns the store; snapshots are shared.

#include "keyview/config/store.hpp"

#include <atomic>
#include <cassert>
#include <memory>
#include <thread>

using keyview::config::ConfigStore;
using keyview::config::Configuration;
using keyview::config::Snapshot;
using keyview::input::KeyTrigger;

static Snapshot makeConfig(unsigned n)
{
    auto cfg = std::make_shared<Configuration>();
    for (unsigned i = 0; i < n; ++i)
    {
        cfg->bindGlobal(KeyTrigger::character(U'a' + i), "action");
    }
    cfg->view.shared_threshold = n;
    return cfg;
}

int main()
{
    ConfigStore empty;
    assert(empty.snapshot() != nullptr);
    assert(empty.snapshot()->global().empty());
    assert(empty.generation() == 0);

    ConfigStore store(makeConfig(1));
    const Snapshot before = store.snapshot();
    assert(before->global().size() == 1);

    store.publish(makeConfig(3));
    assert(store.generation() == 1);
    assert(store.snapshot()->global().size() == 3);
    // Old readers keep the snapshot they took.
    assert(before->global().size() == 1);

    store.publish(nullptr);
    assert(store.generation() == 2);
    assert(store.snapshot() != nullptr);
    assert(store.snapshot()->global().empty());

    // Concurrent readers only ever see consistent snapshots.
    store.publish(makeConfig(0));
    std::atomic<bool> stop{false};
    std::atomic<bool> torn{false};
    std::thread reader(
        [&]
        {
            while (!stop.load())
            {
                const Snapshot s = store.snapshot();
                if (!s || s->global().size() != s->view.shared_threshold)
                {
                    torn.store(true);
                }
            }
        });
    for (unsigned i = 0; i < 200; ++i)
    {
        store.publish(makeConfig(i % 7));
    }
    stop.store(true);
    reader.join();
    assert(!torn.load());
    assert(store.generation() == 203);
    return 0;
}
