#pragma once

namespace mecs::detail {

/**
 * @brief Keeps a world's live-iteration counter raised for as long as it exists.
 * @details Copies raise the counter again; a moved-from guard releases nothing.
 */
class IterationGuard {
public:
    explicit IterationGuard(int& count) : count_(&count) { ++*count_; }

    IterationGuard(const IterationGuard& o) : count_(o.count_) {
        if (count_)
            ++*count_;
    }

    IterationGuard(IterationGuard&& o) noexcept : count_(o.count_) { o.count_ = nullptr; }

    IterationGuard& operator=(const IterationGuard& o) {
        if (this != &o) {
            release();
            count_ = o.count_;
            if (count_)
                ++*count_;
        }
        return *this;
    }

    IterationGuard& operator=(IterationGuard&& o) noexcept {
        if (this != &o) {
            release();
            count_ = o.count_;
            o.count_ = nullptr;
        }
        return *this;
    }

    ~IterationGuard() { release(); }

private:
    void release() {
        if (count_)
            --*count_;
        count_ = nullptr;
    }

    int* count_;
};

} // namespace mecs::detail
