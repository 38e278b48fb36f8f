#pragma once

#include <cstdio>
#include <utility>

namespace playnite {

// Owns a stdio handle; closes it on scope exit unless close() already did.
class UniqueFile {
public:
    UniqueFile() = default;
    explicit UniqueFile(FILE* f) : f_(f) {}
    ~UniqueFile() { reset(); }

    UniqueFile(const UniqueFile&) = delete;
    UniqueFile& operator=(const UniqueFile&) = delete;

    FILE* get() const { return f_; }

    // Buffered writes are only flushed here, so the result matters for writers.
    bool close() {
        if (!f_) return true;
        const int rc = ::fclose(f_);
        f_ = nullptr;
        return rc == 0;
    }

    void reset() {
        if (f_) ::fclose(f_);
        f_ = nullptr;
    }

    explicit operator bool() const { return f_ != nullptr; }

private:
    FILE* f_{nullptr};
};

// Runs a cleanup on scope exit unless dismissed after the happy path.
template <class F>
class ScopeGuard {
public:
    explicit ScopeGuard(F fn) : fn_(std::move(fn)) {}
    ~ScopeGuard() {
        if (armed_) fn_();
    }
    void dismiss() { armed_ = false; }

    ScopeGuard(ScopeGuard&& other) noexcept : fn_(std::move(other.fn_)), armed_(other.armed_) {
        other.armed_ = false;
    }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    F fn_;
    bool armed_{true};
};

template <class F>
ScopeGuard<F> makeScopeGuard(F fn) {
    return ScopeGuard<F>(std::move(fn));
}

} // namespace playnite
