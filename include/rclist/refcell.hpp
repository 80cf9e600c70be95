#ifndef RCLIST_REFCELL_HPP
#define RCLIST_REFCELL_HPP

#include <cassert>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include "option.hpp"

// RefCell<T> - Interior mutability with runtime borrow checking
//
// Guarantees:
// - Single-threaded only (not thread-safe)
// - Multiple immutable borrows OR a single mutable borrow
// - Conflicting borrows throw (BorrowError / BorrowMutError)
// - Borrows are held by RAII guards (Ref<T>, RefMut<T>) and released
//   when the guard is destroyed
// - Guards can be projected onto a member of the borrowed value with
//   Ref::map / RefMut::map; the projection keeps the whole cell borrowed

// @safe
namespace rclist {

template<typename T>
class RefCell;

template<typename T>
class Ref;

template<typename T>
class RefMut;

// Thrown by RefCell::borrow() while the cell is mutably borrowed
class BorrowError : public std::runtime_error {
public:
    BorrowError() : std::runtime_error("RefCell<T>: already mutably borrowed") {}
};

// Thrown by RefCell::borrow_mut() while the cell is borrowed in any way
class BorrowMutError : public std::runtime_error {
public:
    explicit BorrowMutError(const char* what) : std::runtime_error(what) {}
};

namespace detail {

// Borrow bookkeeping shared by a cell and every guard projected from it.
// 0 = unborrowed, >0 = number of readers, -1 = writing
class BorrowFlag {
private:
    mutable long state_;

public:
    BorrowFlag() : state_(0) {}

    BorrowFlag(const BorrowFlag&) = delete;
    BorrowFlag& operator=(const BorrowFlag&) = delete;

    bool try_add_reader() const {
        if (state_ < 0) {
            return false;
        }
        ++state_;
        return true;
    }

    void remove_reader() const {
        assert(state_ > 0);
        --state_;
    }

    bool try_add_writer() const {
        if (state_ != 0) {
            return false;
        }
        state_ = -1;
        return true;
    }

    void remove_writer() const {
        assert(state_ == -1);
        state_ = 0;
    }

    bool is_unused() const { return state_ == 0; }
    bool is_reading() const { return state_ > 0; }
    bool is_writing() const { return state_ < 0; }
};

} // namespace detail

template<typename T>
class RefCell {
private:
    mutable T value_;
    detail::BorrowFlag flag_;

    static RefCell& unborrowed(RefCell& cell, const char* what) {
        if (!cell.flag_.is_unused()) {
            throw BorrowMutError(what);
        }
        return cell;
    }

public:
    RefCell() : value_(), flag_() {}
    explicit RefCell(T val) : value_(std::move(val)), flag_() {}

    // Moving a cell moves its value; a borrowed cell cannot be moved
    RefCell(RefCell&& other)
        : value_(std::move(unborrowed(other, "RefCell<T>: cannot move while borrowed").value_)),
          flag_() {}

    RefCell(const RefCell&) = delete;
    RefCell& operator=(const RefCell&) = delete;
    RefCell& operator=(RefCell&&) = delete;

    ~RefCell() {
#ifdef DEBUG
        assert(flag_.is_unused() && "RefCell<T> dropped while borrowed");
#endif
    }

    // Immutably borrow the value
    // @lifetime: (&'a) -> Ref<'a, T>
    Ref<T> borrow() const {
        if (!flag_.try_add_reader()) {
            throw BorrowError();
        }
        return Ref<T>(&value_, &flag_);
    }

    // Mutably borrow the value
    // @lifetime: (&'a mut) -> RefMut<'a, T>
    RefMut<T> borrow_mut() const {
        if (!flag_.try_add_writer()) {
            throw BorrowMutError(flag_.is_reading()
                ? "RefCell<T>: already immutably borrowed"
                : "RefCell<T>: already mutably borrowed");
        }
        return RefMut<T>(&value_, &flag_);
    }

    // None instead of throwing when the cell is mutably borrowed
    // @lifetime: (&'a) -> Option<Ref<'a, T>>
    Option<Ref<T>> try_borrow() const {
        if (!flag_.try_add_reader()) {
            return None;
        }
        return Some(Ref<T>(&value_, &flag_));
    }

    // None instead of throwing when the cell is borrowed in any way
    // @lifetime: (&'a mut) -> Option<RefMut<'a, T>>
    Option<RefMut<T>> try_borrow_mut() const {
        if (!flag_.try_add_writer()) {
            return None;
        }
        return Some(RefMut<T>(&value_, &flag_));
    }

    bool can_borrow() const {
        return !flag_.is_writing();
    }

    bool can_borrow_mut() const {
        return flag_.is_unused();
    }

    // @lifetime: (&'a, T) -> T
    T replace(T new_value) const {
        if (!flag_.is_unused()) {
            throw BorrowMutError("RefCell<T>: cannot replace while borrowed");
        }
        T old = std::move(value_);
        value_ = std::move(new_value);
        return old;
    }

    // Copy of the value (only for copyable types)
    template<typename U = T>
    typename std::enable_if_t<std::is_copy_constructible_v<U>, T>
    get() const {
        return *borrow();
    }

    // Consume the cell and return its value
    // @lifetime: owned
    T into_inner() && {
        unborrowed(*this, "RefCell<T>: cannot consume while borrowed");
        return std::move(value_);
    }
};

// Ref<T> - RAII guard for an immutable borrow
template<typename T>
class Ref {
private:
    const T* value_;
    const detail::BorrowFlag* flag_;

    template<typename U> friend class RefCell;
    template<typename U> friend class Ref;

    Ref(const T* value, const detail::BorrowFlag* flag)
        : value_(value), flag_(flag) {}

public:
    ~Ref() {
        if (flag_) {
            flag_->remove_reader();
        }
    }

    Ref(Ref&& other) noexcept : value_(other.value_), flag_(other.flag_) {
        other.flag_ = nullptr;
    }

    // Copies are explicit: see clone()
    Ref(const Ref&) = delete;
    Ref& operator=(const Ref&) = delete;
    Ref& operator=(Ref&&) = delete;

    const T& operator*() const {
        return *value_;
    }

    const T* operator->() const {
        return value_;
    }

    // Another shared borrow of the same cell
    static Ref clone(const Ref& orig) {
        bool added = orig.flag_->try_add_reader();
        assert(added);
        (void)added;
        return Ref(orig.value_, orig.flag_);
    }

    // Narrow the guard to a part of the borrowed value. `f` maps
    // const T& to a const reference into that value.
    template<typename F>
    static auto map(Ref orig, F&& f)
        -> Ref<std::remove_cv_t<std::remove_reference_t<decltype(f(std::declval<const T&>()))>>> {
        using U = std::remove_cv_t<std::remove_reference_t<decltype(f(std::declval<const T&>()))>>;
        const U& part = f(*orig.value_);
        Ref<U> projected(&part, orig.flag_);
        orig.flag_ = nullptr;
        return projected;
    }
};

// RefMut<T> - RAII guard for a mutable borrow
template<typename T>
class RefMut {
private:
    T* value_;
    const detail::BorrowFlag* flag_;

    template<typename U> friend class RefCell;
    template<typename U> friend class RefMut;

    RefMut(T* value, const detail::BorrowFlag* flag)
        : value_(value), flag_(flag) {}

public:
    ~RefMut() {
        if (flag_) {
            flag_->remove_writer();
        }
    }

    RefMut(RefMut&& other) noexcept : value_(other.value_), flag_(other.flag_) {
        other.flag_ = nullptr;
    }

    // A mutable borrow is never duplicated
    RefMut(const RefMut&) = delete;
    RefMut& operator=(const RefMut&) = delete;
    RefMut& operator=(RefMut&&) = delete;

    T& operator*() const {
        return *value_;
    }

    T* operator->() const {
        return value_;
    }

    // Narrow the guard to a part of the borrowed value. `f` maps
    // T& to a mutable reference into that value.
    template<typename F>
    static auto map(RefMut orig, F&& f)
        -> RefMut<std::remove_reference_t<decltype(f(std::declval<T&>()))>> {
        using U = std::remove_reference_t<decltype(f(std::declval<T&>()))>;
        U& part = f(*orig.value_);
        RefMut<U> projected(&part, orig.flag_);
        orig.flag_ = nullptr;
        return projected;
    }
};

template<typename T>
RefCell<T> make_refcell(T value) {
    return RefCell<T>(std::move(value));
}

} // namespace rclist

#endif // RCLIST_REFCELL_HPP
