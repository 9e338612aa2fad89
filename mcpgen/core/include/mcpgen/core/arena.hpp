#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgen {

// Owns every canonical IR node of one run. Blocks grow geometrically, so a
// large document costs a handful of allocations; nothing is freed until the
// arena is destroyed or reset.
class monotonic_arena {
public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 64UL * 1024UL;
    static constexpr size_t MAX_ALIGNMENT = 64;
    static constexpr size_t MAX_BLOCKS = 32;
    static constexpr size_t MAX_GROWTH_SHIFT = 10;

    explicit monotonic_arena(size_t block_size = DEFAULT_BLOCK_SIZE) noexcept;
    ~monotonic_arena() noexcept;

    monotonic_arena(const monotonic_arena&) = delete;
    monotonic_arena& operator=(const monotonic_arena&) = delete;
    monotonic_arena(monotonic_arena&&) noexcept;
    monotonic_arena& operator=(monotonic_arena&&) noexcept;

    [[nodiscard]] void* allocate(size_t bytes,
                                 size_t alignment = alignof(std::max_align_t)) noexcept;

    // Placement-constructs a T inside the arena. T's destructor never runs, so
    // T must only own arena memory.
    template <typename T, typename... Args> [[nodiscard]] T* make(Args&&... args) {
        void* mem = allocate(sizeof(T), alignof(T));
        if (!mem) {
            throw std::bad_alloc();
        }
        return new (mem) T(std::forward<Args>(args)...);
    }

    void reset() noexcept;

    [[nodiscard]] size_t bytes_allocated() const noexcept { return bytes_allocated_; }
    [[nodiscard]] size_t total_capacity() const noexcept { return total_capacity_; }
    [[nodiscard]] size_t block_count() const noexcept { return num_blocks_; }

private:
    struct free_deleter {
        void operator()(uint8_t* p) const noexcept { std::free(p); }
    };

    struct block {
        std::unique_ptr<uint8_t, free_deleter> data;
        size_t size = 0;
        size_t used = 0;
    };

    [[nodiscard]] static constexpr size_t align_up(size_t n, size_t alignment) noexcept {
        return (n + alignment - 1) & ~(alignment - 1);
    }

    // Carves `bytes` out of `b`, or returns nullptr when it does not fit.
    [[nodiscard]] static void* bump(block& b, size_t bytes, size_t alignment) noexcept;
    [[nodiscard]] bool allocate_new_block(size_t min_size) noexcept;

    std::array<block, MAX_BLOCKS> blocks_;
    size_t num_blocks_ = 0;
    size_t block_size_;
    size_t bytes_allocated_ = 0;
    size_t total_capacity_ = 0;
};

template <typename T> class arena_allocator {
public:
    using value_type = T;
    using size_type = size_t;
    using difference_type = ptrdiff_t;

    explicit arena_allocator(monotonic_arena* arena) noexcept : arena_(arena) {}

    template <typename U>
    arena_allocator(const arena_allocator<U>& other) noexcept : arena_(other.arena_) {}

    [[nodiscard]] T* allocate(size_t n) {
        if (!arena_) {
            throw std::bad_alloc();
        }
        void* mem = arena_->allocate(n * sizeof(T), alignof(T));
        if (!mem) {
            throw std::bad_alloc();
        }
        return static_cast<T*>(mem);
    }

    void deallocate(T*, size_t) noexcept {}

    template <typename U> bool operator==(const arena_allocator<U>& other) const noexcept {
        return arena_ == other.arena_;
    }

    monotonic_arena* arena_;
};

template <typename T> using arena_vector = std::vector<T, arena_allocator<T>>;

template <typename CharT = char>
using arena_string = std::basic_string<CharT, std::char_traits<CharT>, arena_allocator<CharT>>;

inline arena_string<> make_arena_string(std::string_view sv, monotonic_arena* arena) {
    return arena_string<>(sv.begin(), sv.end(), arena_allocator<char>(arena));
}

} // namespace mcpgen
