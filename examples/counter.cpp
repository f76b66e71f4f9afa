// counter: page-view and inventory counters shared by offline devices
//
// Demonstrates: GCounter, PNCounter, merge in any order, delta sync
// through summaries, and the binary codec.
//
// Build: cmake --build build
// Run:   ./build/examples/counter

#include <crdt-kit/crdt_kit.hpp>
#include <crdt-kit/logging.hpp>

#include <cstdio>

namespace ck = crdt_kit;

int main() {
    ck::logging::init(ck::logging::level::info, ck::logging::sink_type::console);

    // -- Grow-only: three devices count page views offline --------------------
    auto phone = ck::GCounter{"phone"};
    auto laptop = ck::GCounter{"laptop"};
    auto tablet = ck::GCounter{"tablet"};

    phone.increment(3);
    laptop.increment(5);
    tablet.increment();

    // Merge order does not matter.
    auto left = ck::merged(ck::merged(phone, laptop), tablet);
    auto right = ck::merged(tablet, ck::merged(laptop, phone));
    std::printf("page views: %llu == %llu\n",
        static_cast<unsigned long long>(left.value()),
        static_cast<unsigned long long>(right.value()));

    // -- Delta sync: ship only what the peer is missing -----------------------
    phone.merge(left);
    laptop.increment(2);
    auto delta = laptop.delta(phone.summary());
    auto bytes = delta.encode();
    phone.apply_delta(ck::GCounterDelta::decode(bytes));
    std::printf("delta of %zu bytes brought phone to %llu\n",
        bytes.size(), static_cast<unsigned long long>(phone.value()));

    // -- Increment and decrement: warehouse stock ----------------------------
    auto north = ck::PNCounter{"north"};
    auto south = ck::PNCounter{"south"};
    north.increment(40);
    south.decrement(12);
    north.decrement(5);

    north.merge(south);
    south.merge(north);
    std::printf("stock: north=%lld south=%lld\n",
        static_cast<long long>(north.value()),
        static_cast<long long>(south.value()));

    // -- Persist and restore ---------------------------------------------------
    auto saved = north.encode();
    auto restored = ck::PNCounter::decode(saved);
    std::printf("restored %zu bytes, equal: %s\n",
        saved.size(), restored == north ? "yes" : "no");

    ck::logging::write(ck::logging::level::info, "counter example finished");
    return 0;
}
