#ifndef RCLIST_RC_HPP
#define RCLIST_RC_HPP

#include <cassert>
#include <cstddef>
#include <utility>
#include "option.hpp"  // For Option<T> from try_unwrap()

// Rc<T> - single-threaded reference-counted shared ownership
//
// The count and the value live in one heap block (RcBox). The value is
// destroyed and the block freed when the last Rc pointing at it is dropped.
//
// Guarantees:
// - Non-atomic counting (single-threaded only)
// - Shared read-only access; mutation goes through RefCell<T>
// - try_unwrap() hands the value back only to the sole owner
//
// WARNING: Rc cannot collect cycles. Two values that hold Rc's to each
// other are never freed unless one of the links is cleared first.

// @safe
namespace rclist {

namespace detail {

template<typename T>
struct RcBox {
    size_t strong;
    T value;

    template<typename... Args>
    explicit RcBox(Args&&... args)
        : strong(1), value(std::forward<Args>(args)...) {}
};

} // namespace detail

// @unsafe - Raw pointer operations and manual reference counting
template<typename T>
class Rc {
private:
    detail::RcBox<T>* box_;

    explicit Rc(detail::RcBox<T>* box) : box_(box) {}

    // @unsafe
    void release() {
        // @unsafe {
        if (box_ && --box_->strong == 0) {
            delete box_;
        }
        box_ = nullptr;
        // }
    }

public:
    // No default constructor - use Option<Rc<T>> for a nullable Rc
    Rc() = delete;

    // Construct T in place inside a new shared block
    // @lifetime: owned
    template<typename... Args>
    static Rc<T> make(Args&&... args) {
        // @unsafe
        {
            return Rc<T>(new detail::RcBox<T>(std::forward<Args>(args)...));
        }
    }

    // @safe - Copying shares ownership
    Rc(const Rc& other) : box_(other.box_) {
        if (box_) {
            ++box_->strong;
        }
    }

    Rc(Rc&& other) noexcept : box_(other.box_) {
        other.box_ = nullptr;
    }

    Rc& operator=(const Rc& other) {
        if (this != &other) {
            Rc incoming(other);
            release();
            box_ = incoming.box_;
            incoming.box_ = nullptr;
        }
        return *this;
    }

    // The incoming block is detached from `other` before our old block is
    // released, so the release can never reach back into `other`.
    Rc& operator=(Rc&& other) noexcept {
        if (this != &other) {
            detail::RcBox<T>* incoming = other.box_;
            other.box_ = nullptr;
            release();
            box_ = incoming;
        }
        return *this;
    }

    ~Rc() {
        release();
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        assert(box_ != nullptr);
        return box_->value;
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        assert(box_ != nullptr);
        return &box_->value;
    }

    // @lifetime: (&'a) -> &'a
    const T* get() const {
        return box_ ? &box_->value : nullptr;
    }

    // False only for a moved-from Rc
    bool is_valid() const {
        return box_ != nullptr;
    }

    size_t strong_count() const {
        return box_ ? box_->strong : 0;
    }

    // @safe - Explicitly share ownership
    Rc clone() const {
        return Rc(*this);
    }

    // Both handles designate the same allocation
    static bool ptr_eq(const Rc& a, const Rc& b) {
        return a.box_ == b.box_;
    }

    // Mutable access, only when no other Rc shares the value
    // @lifetime: (&'a mut) -> &'a mut
    T* get_mut() {
        if (box_ && box_->strong == 1) {
            return &box_->value;
        }
        return nullptr;
    }

    // Move the value out if this is the only owner. On success this Rc is
    // left empty and the block freed; otherwise None is returned and this Rc
    // is left untouched.
    // @lifetime: owned
    Option<T> try_unwrap() {
        if (!box_ || box_->strong != 1) {
            return None;
        }
        Option<T> value(std::move(box_->value));
        delete box_;
        box_ = nullptr;
        return value;
    }
};

// @safe
template<typename T, typename... Args>
// @lifetime: owned
Rc<T> make_rc(Args&&... args) {
    return Rc<T>::make(std::forward<Args>(args)...);
}

} // namespace rclist

#endif // RCLIST_RC_HPP
