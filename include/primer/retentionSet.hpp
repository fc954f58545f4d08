#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// One allocation unit: a zeroed array of int64 elements.
using AllocationUnit = std::unique_ptr<std::int64_t[]>;
using Slab = std::vector<AllocationUnit>;

inline AllocationUnit allocateUnit(std::size_t elements) {
    return std::make_unique<std::int64_t[]>(elements);
}

// Keeps a pass's units alive until released. Move only.
class RetentionSet {
public:
    RetentionSet() = default;
    RetentionSet(RetentionSet&&) noexcept = default;
    RetentionSet& operator=(RetentionSet&&) noexcept = default;
    RetentionSet(const RetentionSet&)            = delete;
    RetentionSet& operator=(const RetentionSet&) = delete;

    Slab& addSlab(std::size_t capacity) {
        slabs_.emplace_back();
        slabs_.back().reserve(capacity);
        return slabs_.back();
    }

    std::size_t slabCount() const { return slabs_.size(); }
    std::size_t unitCount() const {
        std::size_t n = 0;
        for (const auto& s : slabs_) n += s.size();
        return n;
    }
    const std::vector<Slab>& slabs() const { return slabs_; }

    void release() {
        slabs_.clear();
        slabs_.shrink_to_fit();
    }

private:
    std::vector<Slab> slabs_;
};
