#pragma once

#include <string>
#include <utility>
#include <type_traits>
#include <cassert>


namespace lcr {

// Value-or-absent holder with an always-constructed payload.
// Unlike std::optional the payload is default-constructed while empty,
// so reset() keeps the allocation of string-like payloads reusable.
template <typename T>
class optional {
public:
    optional() : has_(false), value_{} {}
    optional(const T& v) : has_(true), value_(v) {}
    optional(T&& v) : has_(true), value_(std::move(v)) {}

    [[nodiscard]] inline bool has() const noexcept { return has_; }

    [[nodiscard]] inline const T& value() const {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }

    [[nodiscard]] inline T& value() {
        assert(has_ && "lcr::optional::value() called when empty");
        return value_;
    }

    [[nodiscard]] inline const T& value_or(const T& fallback) const noexcept {
        return has_ ? value_ : fallback;
    }

    inline void reset() {
        has_ = false;
        if constexpr (std::is_same_v<T, std::string>) {
            value_.clear();
        } else {
            value_ = T{};
        }
    }

    template <typename... Args>
    inline T& emplace(Args&&... args) {
        value_ = T(std::forward<Args>(args)...);
        has_ = true;
        return value_;
    }

    inline optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    inline optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    // Two empty optionals compare equal regardless of the dormant payload
    [[nodiscard]] friend inline bool operator==(const optional& a, const optional& b) {
        if (a.has_ != b.has_) return false;
        return !a.has_ || a.value_ == b.value_;
    }

private:
    bool has_;
    T value_;
};

} // namespace lcr
