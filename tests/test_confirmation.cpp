#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"

using namespace test_helpers;
using protocol::QueuedConfirmation;

TEST_CASE("QueuedConfirmation", "[protocol][confirmation]") {
    LoopFixture f;
    auto queue = std::make_unique<QueuedConfirmation>();

    SECTION("requests wait until decided") {
        auto decision = observe(queue->request_approval(3, sample_transaction()));
        f.pump();
        REQUIRE_FALSE(decision->settled());
        REQUIRE(queue->pending_ids() == std::vector<uint64_t>{3});
        REQUIRE(queue->transaction(3) == std::optional<Json>(sample_transaction()));
    }

    SECTION("approve resolves true, reject resolves false") {
        auto yes = observe(queue->request_approval(1, sample_transaction()));
        auto no = observe(queue->request_approval(2, sample_transaction()));
        REQUIRE(queue->approve(1));
        REQUIRE(queue->reject(2));
        f.pump();

        REQUIRE(yes->value() == true);
        REQUIRE(no->value() == false);
        REQUIRE(queue->pending_ids().empty());
    }

    SECTION("deciding an unknown or decided id returns false") {
        REQUIRE_FALSE(queue->approve(9));
        auto yes = observe(queue->request_approval(1, sample_transaction()));
        REQUIRE(queue->approve(1));
        REQUIRE_FALSE(queue->reject(1));
    }

    SECTION("abandoned requests are pruned") {
        {
            auto dropped = queue->request_approval(4, sample_transaction());
        }
        REQUIRE(queue->pending_ids().empty());
        REQUIRE_FALSE(queue->approve(4));
        REQUIRE_FALSE(queue->transaction(4).has_value());
    }

    SECTION("the same id from two pages is decided one at a time") {
        auto first = observe(queue->request_approval(1, sample_transaction()));
        auto second = observe(queue->request_approval(1, sample_transaction()));
        REQUIRE(queue->pending_ids() == std::vector<uint64_t>{1, 1});

        REQUIRE(queue->approve(1));
        f.pump();
        REQUIRE(first->value() == true);
        REQUIRE_FALSE(second->settled());
        REQUIRE(queue->pending_ids() == std::vector<uint64_t>{1});
    }

    SECTION("closing the queue rejects what is undecided") {
        auto decision = observe(queue->request_approval(5, sample_transaction()));
        queue.reset();
        f.pump();
        REQUIRE(decision->rejected());
        REQUIRE(decision->error() == "Confirmation surface closed");
    }
}
