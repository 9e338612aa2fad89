#include "mcpgen/core/arena.hpp"

#include <algorithm>

namespace mcpgen {

monotonic_arena::monotonic_arena(size_t block_size) noexcept
    : block_size_(std::max<size_t>(block_size, MAX_ALIGNMENT)) {}

monotonic_arena::~monotonic_arena() noexcept = default;

monotonic_arena::monotonic_arena(monotonic_arena&& other) noexcept
    : blocks_(std::move(other.blocks_)), num_blocks_(std::exchange(other.num_blocks_, 0)),
      block_size_(other.block_size_),
      bytes_allocated_(std::exchange(other.bytes_allocated_, 0)),
      total_capacity_(std::exchange(other.total_capacity_, 0)) {}

monotonic_arena& monotonic_arena::operator=(monotonic_arena&& other) noexcept {
    if (this != &other) {
        blocks_ = std::move(other.blocks_);
        num_blocks_ = std::exchange(other.num_blocks_, 0);
        block_size_ = other.block_size_;
        bytes_allocated_ = std::exchange(other.bytes_allocated_, 0);
        total_capacity_ = std::exchange(other.total_capacity_, 0);
    }
    return *this;
}

void monotonic_arena::reset() noexcept {
    for (size_t i = 0; i < num_blocks_; ++i) {
        blocks_[i].used = 0;
    }
    bytes_allocated_ = 0;
}

void* monotonic_arena::bump(block& b, size_t bytes, size_t alignment) noexcept {
    if (!b.data) {
        return nullptr;
    }
    auto base = reinterpret_cast<uintptr_t>(b.data.get());
    size_t offset = align_up(base + b.used, alignment) - base;
    if (offset > b.size || b.size - offset < bytes) {
        return nullptr;
    }
    b.used = offset + bytes;
    return b.data.get() + offset;
}

void* monotonic_arena::allocate(size_t bytes, size_t alignment) noexcept {
    if (alignment == 0 || (alignment & (alignment - 1)) != 0 || alignment > MAX_ALIGNMENT) {
        return nullptr;
    }
    bytes = std::max<size_t>(bytes, 1);

    // Newest blocks are the largest and the most likely to have room.
    for (size_t i = num_blocks_; i-- > 0;) {
        if (void* p = bump(blocks_[i], bytes, alignment)) {
            bytes_allocated_ += bytes;
            return p;
        }
    }

    size_t grown = block_size_ << std::min(num_blocks_, MAX_GROWTH_SHIFT);
    if (!allocate_new_block(std::max(grown, bytes + MAX_ALIGNMENT))) {
        return nullptr;
    }
    void* p = bump(blocks_[num_blocks_ - 1], bytes, alignment);
    if (p) {
        bytes_allocated_ += bytes;
    }
    return p;
}

bool monotonic_arena::allocate_new_block(size_t min_size) noexcept {
    if (num_blocks_ >= MAX_BLOCKS) {
        return false;
    }
    size_t size = align_up(min_size, MAX_ALIGNMENT);
    auto* data = static_cast<uint8_t*>(std::aligned_alloc(MAX_ALIGNMENT, size));
    if (!data) {
        return false;
    }

    auto& b = blocks_[num_blocks_++];
    b.data.reset(data);
    b.size = size;
    b.used = 0;
    total_capacity_ += size;
    return true;
}

} // namespace mcpgen
