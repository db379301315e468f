#include <catch2/catch.hpp>
#include <condition_variable>
#include <thread>
#include "memory/compression_engine.hpp"
#include "storage/in_memory_storage.hpp"
#include "sync/delivery_pool.hpp"
#include "sync/sync_engine.hpp"
#include "sync/sync_worker.hpp"
#include "test_support.hpp"

using namespace memsync;
using namespace memsync::memory;
using memsync::sync::SyncEngine;
using memsync::sync::SyncOperationType;
using memsync::testing::Delivery;
using memsync::testing::FakeAdapter;
using memsync::testing::ManualClock;
using memsync::testing::make_entry;

namespace {

struct DeliveryFixture {
    ManualClock clock;
    std::shared_ptr<storage::InMemoryStorage> store = std::make_shared<storage::InMemoryStorage>(clock.fn());
    SyncEngine engine{store, sync::SyncConfig{}, clock.fn()};
    std::shared_ptr<FakeAdapter> b = std::make_shared<FakeAdapter>("B", 10000);
    std::shared_ptr<FakeAdapter> c = std::make_shared<FakeAdapter>("C", 10000);

    DeliveryFixture() {
        engine.register_adapter(b);
        engine.register_adapter(c);
    }
};

std::vector<std::string> actions(const std::vector<Delivery>& deliveries) {
    std::vector<std::string> out;
    for (const auto& d : deliveries) out.push_back(d.action);
    return out;
}

// One-shot latch shared by the two adapters below
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;
};

// Succeeds only if the gate opens while it is waiting
class WaitingAdapter : public FakeAdapter {
public:
    WaitingAdapter(std::string name, std::shared_ptr<Gate> gate)
        : FakeAdapter(std::move(name), 10000), gate_(std::move(gate)) {}

    std::atomic<bool> entered{false};

protected:
    bool record(const std::string& action, const std::string& key, const MemoryEntry& entry) override {
        entered = true;
        std::unique_lock<std::mutex> lock(gate_->mutex);
        if (!gate_->cv.wait_for(lock, std::chrono::seconds(2), [this]() { return gate_->open; })) {
            return false;
        }
        lock.unlock();
        return FakeAdapter::record(action, key, entry);
    }

private:
    std::shared_ptr<Gate> gate_;
};

class OpeningAdapter : public FakeAdapter {
public:
    OpeningAdapter(std::string name, std::shared_ptr<Gate> gate)
        : FakeAdapter(std::move(name), 10000), gate_(std::move(gate)) {}

protected:
    bool record(const std::string& action, const std::string& key, const MemoryEntry& entry) override {
        {
            std::lock_guard<std::mutex> lock(gate_->mutex);
            gate_->open = true;
        }
        gate_->cv.notify_all();
        return FakeAdapter::record(action, key, entry);
    }

private:
    std::shared_ptr<Gate> gate_;
};

} // namespace

TEST_CASE("delivery pool returns task results", "[delivery]") {
    sync::DeliveryPool pool(2);
    REQUIRE(pool.worker_count() == 2);

    auto ok = pool.submit([]() { return true; });
    auto failed = pool.submit([]() { return false; });
    auto thrown = pool.submit([]() -> bool { throw std::runtime_error("boom"); });

    REQUIRE(ok.get());
    REQUIRE_FALSE(failed.get());
    REQUIRE_THROWS_AS(thrown.get(), std::runtime_error);
}

TEST_CASE_METHOD(DeliveryFixture, "registration sets budgets from the context window", "[delivery]") {
    REQUIRE(engine.budgets().ceiling("B") == 10000);

    auto store2 = std::make_shared<storage::InMemoryStorage>();
    sync::SyncConfig config;
    config.tool_budgets = {{"B", 50}};
    SyncEngine configured(store2, config);
    REQUIRE(configured.register_adapter(std::make_shared<FakeAdapter>("B", 10000)));
    REQUIRE(configured.budgets().ceiling("B") == 50);

    REQUIRE_FALSE(engine.register_adapter(nullptr));
    REQUIRE_FALSE(engine.register_adapter(std::make_shared<FakeAdapter>("", 10)));
}

TEST_CASE_METHOD(DeliveryFixture, "shared writes fan out to every other consumer", "[delivery]") {
    REQUIRE(engine.create("k", make_entry("shared fact"), "A").success);
    REQUIRE(engine.pending_count() == 1);
    REQUIRE(engine.pending_operations()[0].targets == std::vector<std::string>{"B", "C"});

    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(engine.pending_count() == 0);

    REQUIRE(b->deliveries().size() == 1);
    REQUIRE(b->deliveries()[0].action == "create");
    REQUIRE(b->deliveries()[0].entry.content == "shared fact");
    REQUIRE(c->deliveries().size() == 1);

    auto stored = store->peek("k");
    REQUIRE(stored->metadata.sync_status.at("B") == 1);
    REQUIRE(stored->metadata.sync_status.at("C") == 1);

    // delivery checks budgets but does not spend them
    REQUIRE(engine.budgets().usage("B") == 0);
}

TEST_CASE_METHOD(DeliveryFixture, "the origin is never a target", "[delivery]") {
    REQUIRE(engine.create("k", make_entry("from B"), "B").success);
    REQUIRE(engine.pending_operations()[0].targets == std::vector<std::string>{"C"});
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(b->deliveries().empty());
}

TEST_CASE_METHOD(DeliveryFixture, "tool-specific entries are not delivered", "[delivery]") {
    auto entry = make_entry("private");
    entry.memory_type = MemoryType::TOOL_SPECIFIC;
    REQUIRE(engine.create("k", entry, "A").success);
    REQUIRE(engine.pending_count() == 0);
    REQUIRE(engine.process_pending_operations() == 0);
    REQUIRE(b->calls == 0);
}

TEST_CASE_METHOD(DeliveryFixture, "failed targets are retried alone", "[delivery]") {
    c->failing = true;
    REQUIRE(engine.create("k", make_entry("retry me"), "A").success);

    REQUIRE(engine.process_pending_operations() == 0);
    REQUIRE(engine.pending_count() == 1);
    auto pending = engine.pending_operations()[0];
    REQUIRE(pending.targets == std::vector<std::string>{"C"});
    REQUIRE(pending.attempts == 1);
    REQUIRE(store->peek("k")->metadata.sync_status.count("C") == 0);

    c->failing = false;
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(engine.pending_count() == 0);
    REQUIRE(b->deliveries().size() == 1);
    REQUIRE(c->deliveries().size() == 1);
    REQUIRE(store->peek("k")->metadata.sync_status.at("C") == 1);
}

TEST_CASE_METHOD(DeliveryFixture, "adapter exceptions count as failures", "[delivery]") {
    c->throwing = true;
    REQUIRE(engine.create("k", make_entry("x"), "A").success);

    REQUIRE_NOTHROW(engine.process_pending_operations());
    REQUIRE(engine.pending_count() == 1);
    REQUIRE(b->deliveries().size() == 1);

    c->throwing = false;
    REQUIRE(engine.process_pending_operations() == 1);
}

TEST_CASE_METHOD(DeliveryFixture, "deletes are delivered", "[delivery]") {
    REQUIRE(engine.create("k", make_entry("x"), "A").success);
    REQUIRE(engine.process_pending_operations() == 1);

    REQUIRE(engine.erase("k", "A"));
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(actions(b->deliveries()) == std::vector<std::string>{"create", "delete"});
    REQUIRE(b->deliveries()[1].key == "k");
}

TEST_CASE_METHOD(DeliveryFixture, "purged entries are deleted downstream", "[delivery]") {
    REQUIRE(engine.create("k", make_entry("x", 0, 10), "A").success);
    REQUIRE(engine.process_pending_operations() == 1);

    clock.advance(std::chrono::seconds(11));
    REQUIRE(engine.purge_expired() == 1);
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(actions(c->deliveries()) == std::vector<std::string>{"create", "delete"});
}

TEST_CASE_METHOD(DeliveryFixture, "deliveries are compressed to the target's budget", "[delivery]") {
    auto tiny = std::make_shared<FakeAdapter>("tiny", 1);
    auto small = std::make_shared<FakeAdapter>("small", 30);
    engine.register_adapter(tiny);
    engine.register_adapter(small);

    REQUIRE(engine.create("k", make_entry(std::string(2000, 'x')), "A").success);
    REQUIRE(engine.process_pending_operations() == 0);

    REQUIRE(tiny->deliveries().empty());
    REQUIRE(small->deliveries().size() == 1);
    const auto& delivered = small->deliveries()[0].entry;
    REQUIRE(delivered.compression_level == CompressionLevel::REFERENCE_ONLY);
    REQUIRE(delivered.content.get<std::string>() ==
            CompressionEngine::reference_string(store->peek("k")->metadata.content_hash));

    REQUIRE(b->deliveries()[0].entry.compression_level == CompressionLevel::NONE);
    REQUIRE(engine.pending_operations()[0].targets == std::vector<std::string>{"tiny"});
}

TEST_CASE_METHOD(DeliveryFixture, "operations for unknown targets stay queued", "[delivery]") {
    REQUIRE(engine.unregister_adapter("C"));
    REQUIRE_FALSE(engine.unregister_adapter("C"));
    REQUIRE(engine.create("k", make_entry("x"), "A").success);
    REQUIRE(engine.pending_operations()[0].targets == std::vector<std::string>{"B"});

    REQUIRE(engine.unregister_adapter("B"));
    REQUIRE(engine.process_pending_operations() == 0);
    REQUIRE(engine.pending_count() == 1);

    REQUIRE(engine.register_adapter(b));
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(b->deliveries().size() == 1);
}

TEST_CASE_METHOD(DeliveryFixture, "a recovering consumer sees writes in order", "[delivery]") {
    b->failing = true;
    REQUIRE(engine.create("k", make_entry("v1"), "A").success);
    REQUIRE(engine.update("k", make_entry("v2"), "A").success);

    REQUIRE(engine.process_pending_operations() == 0);
    // the update waits behind the failed create instead of overtaking it
    REQUIRE(b->calls == 1);
    REQUIRE(engine.pending_count() == 2);
    REQUIRE(c->deliveries().size() == 2);

    b->failing = false;
    REQUIRE(engine.process_pending_operations() == 2);
    auto received = b->deliveries();
    REQUIRE(actions(received) == std::vector<std::string>{"create", "update"});
    REQUIRE(received[0].entry.content == "v1");
    REQUIRE(received[1].entry.content == "v2");
    REQUIRE(store->peek("k")->metadata.sync_status.at("B") == 2);
}

TEST_CASE("one slow consumer does not serialize the others", "[delivery][concurrency]") {
    auto gate = std::make_shared<Gate>();
    auto store = std::make_shared<storage::InMemoryStorage>();
    SyncEngine engine(store);
    auto waiting = std::make_shared<WaitingAdapter>("B", gate);
    auto opening = std::make_shared<OpeningAdapter>("C", gate);
    engine.register_adapter(waiting);
    engine.register_adapter(opening);

    REQUIRE(engine.create("k", make_entry("x"), "A").success);
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(waiting->deliveries().size() == 1);
    REQUIRE(opening->deliveries().size() == 1);
}

TEST_CASE_METHOD(DeliveryFixture, "abandoned operations leave the queue", "[delivery]") {
    b->failing = true;
    REQUIRE(engine.create("k", make_entry("x"), "A").success);
    REQUIRE(engine.create("other", make_entry("y"), "A").success);
    REQUIRE(engine.process_pending_operations() == 0);

    REQUIRE(engine.abandon_pending("k") == 1);
    REQUIRE(engine.pending_count() == 1);
    REQUIRE(engine.pending_operations()[0].key == "other");
    REQUIRE(engine.abandon_pending("k") == 0);
}

TEST_CASE("abandoning does not wait for a blocked drain", "[delivery][concurrency]") {
    auto gate = std::make_shared<Gate>();
    SyncEngine engine(std::make_shared<storage::InMemoryStorage>());
    auto hanging = std::make_shared<WaitingAdapter>("B", gate);
    engine.register_adapter(hanging);
    REQUIRE(engine.create("k", make_entry("stuck"), "A").success);

    size_t drained = 1;
    std::thread drainer([&engine, &drained]() { drained = engine.process_pending_operations(); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!hanging->entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(hanging->entered.load());

    // the drain is still waiting on the adapter here
    size_t abandoned = engine.abandon_pending("k");

    hanging->failing = true;
    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        gate->open = true;
    }
    gate->cv.notify_all();
    drainer.join();

    REQUIRE(abandoned == 1);
    REQUIRE(drained == 0);
    // the failed delivery is not put back
    REQUIRE(engine.pending_count() == 0);
}

TEST_CASE("rebuilding a context window does not double-count it", "[delivery]") {
    SyncEngine engine(std::make_shared<storage::InMemoryStorage>());
    auto narrow = std::make_shared<FakeAdapter>("B", 100);
    engine.register_adapter(narrow);

    REQUIRE(engine.create("k1", make_entry(std::string(300, 'x')), "A").success);
    REQUIRE(engine.process_pending_operations() == 1);

    auto first = engine.optimize_context_window("B");
    REQUIRE(first.admitted.size() == 1);
    REQUIRE(engine.budgets().usage("B") == 75);

    auto second = engine.optimize_context_window("B");
    REQUIRE(second.admitted.size() == 1);
    REQUIRE(second.admitted[0].key == first.admitted[0].key);
    REQUIRE(second.dropped.empty());
    REQUIRE(engine.budgets().usage("B") == 75);

    // the remaining room still takes new writes
    REQUIRE(engine.create("k2", make_entry(std::string(40, 'y')), "A").success);
    REQUIRE(engine.process_pending_operations() == 1);
    REQUIRE(engine.pending_count() == 0);
    REQUIRE(narrow->deliveries().size() == 2);
}

TEST_CASE_METHOD(DeliveryFixture, "audit trail records mutations with their targets", "[delivery]") {
    REQUIRE(engine.create("k", make_entry("x"), "A").success);
    REQUIRE(engine.update("k", make_entry("y"), "A").success);
    REQUIRE(engine.erase("k", "A"));

    auto log = engine.audit_log();
    REQUIRE(log.size() == 3);
    REQUIRE(log[0].type == SyncOperationType::CREATED);
    REQUIRE(log[1].type == SyncOperationType::UPDATED);
    REQUIRE(log[2].type == SyncOperationType::DELETED);
    REQUIRE(log[0].id < log[1].id);

    auto j = log[0].to_json();
    REQUIRE(j["type"] == "CREATED");
    REQUIRE(j["targets"] == nlohmann::json::array({"B", "C"}));
    REQUIRE(j["origin"] == "A");
    REQUIRE_FALSE(j.contains("version"));
}

TEST_CASE_METHOD(DeliveryFixture, "status includes adapter health", "[delivery]") {
    c->failing = true;
    auto status = engine.get_memory_status().to_json();
    REQUIRE(status["tools"]["B"]["status"] == "ok");
    REQUIRE(status["tools"]["C"]["status"] == "failing");
    REQUIRE(status["token_usage"]["B"] == 0);
}

TEST_CASE_METHOD(DeliveryFixture, "background worker drains the queue", "[delivery][worker]") {
    sync::SyncWorker worker(engine, std::chrono::milliseconds(20));
    worker.start();
    REQUIRE(worker.is_running());

    REQUIRE(engine.create("k", make_entry("async"), "A").success);
    worker.wake();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while ((b->deliveries().empty() || c->deliveries().empty() || engine.pending_count() > 0) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    REQUIRE(engine.pending_count() == 0);
    REQUIRE(b->deliveries().size() == 1);

    worker.stop();
    REQUIRE_FALSE(worker.is_running());
    REQUIRE(worker.cycles() > 0);
}
