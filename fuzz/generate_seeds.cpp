// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself; it only writes a seed corpus.

#include <crdt-kit/crdt_kit.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    using namespace crdt_kit;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: counters
    {
        auto c = PNCounter{"a"};
        c.increment(5);
        c.decrement(2);
        write_seed(dir + "/seed_pncounter.bin", c.encode());
        write_seed(dir + "/seed_pncounter_delta.bin", c.delta({}).encode());
    }

    // Seed 2: add-wins set with tombstones
    {
        auto s = ORSet<std::string>{"a"};
        s.add("milk");
        s.add("eggs");
        s.remove("milk");
        write_seed(dir + "/seed_or_set.bin", s.encode());
    }

    // Seed 3: conflicted register
    {
        auto a = MVRegister<std::string>{"a"};
        auto b = MVRegister<std::string>{"b"};
        a.set("x");
        b.set("y");
        a.merge(b);
        write_seed(dir + "/seed_mv_register.bin", a.encode());
    }

    // Seed 4: text, raw and deflated
    {
        auto t = TextCrdt{"a"};
        t.insert_str(0, "hello world");
        t.remove(0);
        write_seed(dir + "/seed_text.bin", t.encode());
        write_seed(dir + "/seed_text_deflate.bin", t.encode(CodecOptions{.deflate_threshold = 0}));
    }

    return 0;
}
