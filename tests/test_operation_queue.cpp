#include <catch2/catch.hpp>
#include <thread>
#include "sync/operation_queue.hpp"

using namespace memsync::sync;

namespace {

SyncOperation op(uint64_t id, const std::string& key) {
    SyncOperation operation;
    operation.id = id;
    operation.type = SyncOperationType::UPDATED;
    operation.key = key;
    operation.targets = {"cline"};
    return operation;
}

std::vector<uint64_t> ids(const std::vector<SyncOperation>& ops) {
    std::vector<uint64_t> out;
    for (const auto& o : ops) out.push_back(o.id);
    return out;
}

} // namespace

TEST_CASE("take_all drains in arrival order", "[queue]") {
    OperationQueue queue;
    queue.push(op(1, "a"));
    queue.push(op(2, "b"));
    queue.push(op(3, "a"));

    REQUIRE(queue.size() == 3);
    REQUIRE(ids(queue.take_all()) == std::vector<uint64_t>{1, 2, 3});
    REQUIRE(queue.size() == 0);
    REQUIRE(queue.take_all().empty());
}

TEST_CASE("requeued operations go ahead of newer ones", "[queue]") {
    OperationQueue queue;
    queue.push(op(1, "a"));
    queue.push(op(2, "b"));
    auto taken = queue.take_all();

    queue.push(op(3, "c"));
    queue.requeue(std::move(taken));

    REQUIRE(ids(queue.snapshot()) == std::vector<uint64_t>{1, 2, 3});
}

TEST_CASE("remove_key drops only that key", "[queue]") {
    OperationQueue queue;
    queue.push(op(1, "a"));
    queue.push(op(2, "b"));
    queue.push(op(3, "a"));

    REQUIRE(queue.remove_key("a") == 2);
    REQUIRE(ids(queue.snapshot()) == std::vector<uint64_t>{2});
    REQUIRE(queue.remove_key("missing") == 0);
}

TEST_CASE("keys removed mid-drain are not requeued", "[queue]") {
    OperationQueue queue;
    queue.push(op(1, "a"));
    queue.push(op(2, "b"));
    queue.push(op(3, "a"));
    auto taken = queue.take_all();

    REQUIRE(queue.remove_key("a") == 2);
    queue.push(op(9, "a"));

    REQUIRE(queue.requeue(std::move(taken)) == 1);
    REQUIRE(ids(queue.snapshot()) == std::vector<uint64_t>{2, 9});

    // the next drain starts clean
    queue.take_all();
    REQUIRE(queue.requeue({op(9, "a")}) == 1);
    REQUIRE(queue.size() == 1);
}

TEST_CASE("snapshot does not consume", "[queue]") {
    OperationQueue queue;
    queue.push(op(7, "a"));
    REQUIRE(queue.snapshot().size() == 1);
    REQUIRE(queue.size() == 1);
}

TEST_CASE("concurrent producers lose nothing", "[queue][concurrency]") {
    OperationQueue queue;
    constexpr int kProducers = 6;
    constexpr int kPerProducer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.push(op(static_cast<uint64_t>(p * kPerProducer + i), "k" + std::to_string(p)));
            }
        });
    }

    size_t drained = 0;
    for (int round = 0; round < 50; ++round) {
        drained += queue.take_all().size();
    }
    for (auto& producer : producers) producer.join();
    drained += queue.take_all().size();

    REQUIRE(drained == static_cast<size_t>(kProducers * kPerProducer));
}
