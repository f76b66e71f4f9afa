// todo_list: a shared todo list edited by two people offline
//
// Demonstrates: ORSet add-wins semantics, re-adding after remove,
// LWWRegister for the list title with hybrid logical clocks,
// MVRegister keeping concurrent edits visible, and 2P-Set for
// permanently archived items.
//
// Build: cmake --build build
// Run:   ./build/examples/todo_list

#include <crdt-kit/crdt_kit.hpp>
#include <crdt-kit/logging.hpp>

#include <cstdio>
#include <string>

namespace ck = crdt_kit;

static void print_items(const char* who, const ck::ORSet<std::string>& items) {
    std::printf("%s:", who);
    for (const auto& item : items.value()) std::printf(" [%s]", item.c_str());
    std::printf("\n");
}

int main() {
    ck::logging::init(ck::logging::level::info, ck::logging::sink_type::console);

    auto alice = ck::ORSet<std::string>{"alice"};
    alice.add("buy milk");
    alice.add("call plumber");
    alice.add("water plants");

    // Bob starts from Alice's copy.
    auto bob = ck::ORSet<std::string>{"bob"};
    bob.merge(alice);

    // Offline: Alice finishes "buy milk" while Bob adds it again as a reminder.
    alice.remove("buy milk");
    bob.add("buy milk");
    bob.remove("water plants");
    alice.add("book flights");

    alice.merge(bob);
    bob.merge(alice);
    print_items("alice", alice);
    print_items("bob  ", bob);
    std::printf("converged: %s, \"buy milk\" survived: %s\n",
        alice == bob ? "yes" : "no", alice.contains("buy milk") ? "yes" : "no");

    // -- List title: last writer wins -----------------------------------------
    auto alice_clock = ck::HybridClock{};
    auto bob_clock = ck::HybridClock{};
    auto title_a = ck::LWWRegister<std::string>{"alice"};
    auto title_b = ck::LWWRegister<std::string>{"bob"};
    title_a.set("Weekend", alice_clock);
    bob_clock.receive(title_a.timestamp());
    title_b.set("Weekend chores", bob_clock);
    title_a.merge(title_b);
    std::printf("title: %s\n", title_a.value().value_or("").c_str());

    // -- Due date: keep every concurrent value --------------------------------
    auto due_a = ck::MVRegister<std::string>{"alice"};
    auto due_b = ck::MVRegister<std::string>{"bob"};
    due_a.set("saturday");
    due_b.set("sunday");
    due_a.merge(due_b);
    std::printf("due date conflicted: %s (", due_a.is_conflicted() ? "yes" : "no");
    for (const auto& v : due_a.values()) std::printf(" %s", v.c_str());
    std::printf(" )\n");
    due_a.set("sunday");
    std::printf("resolved: %s\n", due_a.is_conflicted() ? "no" : "yes");

    // -- Archive: once removed, never back ------------------------------------
    auto archive = ck::TwoPSet<std::string>{};
    archive.insert("old project");
    archive.remove("old project");
    archive.insert("old project");
    std::printf("archived item visible: %s\n", archive.contains("old project") ? "yes" : "no");

    ck::logging::write(ck::logging::level::info, "todo_list example finished");
    return 0;
}
