// Fails to link where 64-bit atomics live in libatomic.

#include <atomic>
#include <cstdint>

int main()
{
    std::atomic<std::uint64_t> counter{0};
    std::uint64_t expected = 0;

    counter.fetch_add(5);
    counter.compare_exchange_strong(expected, 7);

    return static_cast<int>(counter.load() & 0x7f);
}
