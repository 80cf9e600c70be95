#ifndef RCLIST_BOX_HPP
#define RCLIST_BOX_HPP

#include <cassert>
#include <utility>  // for std::move, std::forward

// Box<T> - a heap-allocated value with a single owner
//
// The link type of the exclusive-ownership stack: every stack node is owned
// by exactly one Box, either the stack's head slot or the previous node's
// next slot.
//
// Guarantees:
// - Single ownership (no copying)
// - Deallocation when the owning Box goes out of scope
// - Empty only after being moved from

// @safe
namespace rclist {

template<typename T>
class Box {
private:
    T* ptr;

    explicit Box(T* p) : ptr(p) {}

public:
    // Non-nullable; use Option<Box<T>> for an optional link
    Box() = delete;

    // Construct the boxed value in place
    template<typename... Args>
    // @lifetime: owned
    static Box<T> make(Args&&... args) {
        // @unsafe
        {
            return Box<T>(new T(std::forward<Args>(args)...));
        }
    }

    Box(const Box&) = delete;
    Box& operator=(const Box&) = delete;

    // @lifetime: owned
    Box(Box&& other) noexcept : ptr(other.ptr) {
        other.ptr = nullptr;
    }

    // The incoming pointer is detached before the old value is deleted, so
    // assigning a box that the old value (transitively) owns is safe.
    // @lifetime: owned
    Box& operator=(Box&& other) noexcept {
        // @unsafe
        {
            if (this != &other) {
                T* old = ptr;
                ptr = other.ptr;
                other.ptr = nullptr;
                delete old;
            }
            return *this;
        }
    }

    ~Box() {
        // @unsafe
        {
            delete ptr;
        }
    }

    // @lifetime: (&'a) -> &'a
    T& operator*() {
        assert(ptr != nullptr);
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        assert(ptr != nullptr);
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a
    T* operator->() {
        assert(ptr != nullptr);
        return ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        assert(ptr != nullptr);
        return ptr;
    }

    // @lifetime: (&'a) -> &'a
    T* get() const {
        return ptr;
    }

    bool is_valid() const {
        return ptr != nullptr;
    }

    // Move the value out of the heap slot and free it (Rust: *boxed)
    // @lifetime: owned
    T into_inner() {
        // @unsafe
        {
            assert(ptr != nullptr);
            T value = std::move(*ptr);
            delete ptr;
            ptr = nullptr;
            return value;
        }
    }
};

template<typename T, typename... Args>
// @lifetime: owned
Box<T> make_box(Args&&... args) {
    return Box<T>::make(std::forward<Args>(args)...);
}

} // namespace rclist

#endif // RCLIST_BOX_HPP
