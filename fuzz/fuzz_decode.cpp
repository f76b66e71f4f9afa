// Fuzz target for every decode routine: the whole envelope and payload
// stack. Input must either decode or throw DecodeError; anything that
// decodes must survive re-encoding and a merge with itself.

#include <crdt-kit/crdt_kit.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <string>

namespace {

template <typename T>
void exercise(std::span<const std::byte> bytes) {
    auto state = crdt_kit::try_decode<T>(bytes);
    if (!state) return;

    auto copy = *state;
    copy.merge(*state);
    if (!(copy == *state)) std::abort();

    if (!(T::decode(state->encode()) == *state)) std::abort();
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    using namespace crdt_kit;
    exercise<GCounter>(span);
    exercise<PNCounter>(span);
    exercise<GSet<std::string>>(span);
    exercise<TwoPSet<std::int64_t>>(span);
    exercise<LWWRegister<std::string>>(span);
    exercise<MVRegister<std::string>>(span);
    exercise<ORSet<std::string>>(span);
    exercise<Rga<char32_t>>(span);
    exercise<TextCrdt>(span);

    (void)try_decode<GCounterDelta>(span);
    (void)try_decode<PNCounterDelta>(span);
    (void)try_decode<ORSetDelta<std::string>>(span);
    return 0;
}
