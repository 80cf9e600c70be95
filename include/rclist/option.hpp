#ifndef RCLIST_OPTION_HPP
#define RCLIST_OPTION_HPP

#include <new>
#include <stdexcept>
#include <utility>

// Option<T> - an explicitly nullable value
//
// Used for every Link in the lists (Option<Box<Node>>, Option<Rc<...>>) and
// for every "no value" result (pop/peek on an empty container).
//
// Guarantees:
// - Absence is a normal state, never a null pointer
// - unwrap()/expect() on None throw std::runtime_error
// - take() moves the value out and leaves None behind

// @safe
namespace rclist {

// @safe
struct None_t {
    constexpr None_t() noexcept = default;
};
inline constexpr None_t None{};

// @safe
template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char empty;
    };

    void reset() {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    Option() : has_value(false), empty(0) {}

    Option(None_t) : has_value(false), empty(0) {}

    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(other.value);
        }
    }

    Option(Option&& other) noexcept : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(std::move(other.value));
            other.reset();
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            Option incoming(other);
            *this = std::move(incoming);
        }
        return *this;
    }

    // The moved-in value is detached from `other` before the old value is
    // destroyed, so assigning a link that the old value keeps alive is safe.
    Option& operator=(Option&& other) noexcept {
        if (this != &other) {
            Option incoming(std::move(other));
            reset();
            if (incoming.has_value) {
                new (&value) T(std::move(incoming.value));
                has_value = true;
            }
        }
        return *this;
    }

    ~Option() {
        reset();
    }

    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    // Move the value out (panics if None)
    // @lifetime: owned
    T unwrap() {
        return expect("Called unwrap on None");
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!has_value) {
            throw std::runtime_error(msg);
        }
        T result = std::move(value);
        reset();
        return result;
    }

    // @lifetime: owned
    T unwrap_or(T fallback) {
        if (has_value) {
            return unwrap();
        }
        return fallback;
    }

    // Consume the value through f, yielding Option<U>
    template<typename F>
    // @lifetime: owned
    auto map(F&& f) -> Option<decltype(f(std::declval<T>()))> {
        using U = decltype(f(std::declval<T>()));
        if (has_value) {
            return Option<U>(f(unwrap()));
        }
        return Option<U>(None);
    }

    // f must itself return an Option
    template<typename F>
    // @lifetime: owned
    auto and_then(F&& f) -> decltype(f(std::declval<T>())) {
        if (has_value) {
            return f(unwrap());
        }
        return None;
    }

    // Take the value out, leaving None
    // @lifetime: owned
    Option<T> take() {
        Option<T> result(std::move(*this));
        return result;
    }

    // Store a new value, returning the previous one
    // @lifetime: owned
    Option<T> replace(T new_value) {
        Option<T> old = take();
        new (&value) T(std::move(new_value));
        has_value = true;
        return old;
    }

    // @lifetime: (&'a) -> Option<&'a T>
    Option<T&> as_ref() & {
        if (has_value) {
            return Option<T&>(value);
        }
        return None;
    }

    // @lifetime: (&'a) -> Option<&'a const T>
    Option<const T&> as_ref() const & {
        if (has_value) {
            return Option<const T&>(value);
        }
        return None;
    }

    // @lifetime: (&'a mut) -> Option<&'a mut T>
    Option<T&> as_mut() & {
        if (has_value) {
            return Option<T&>(value);
        }
        return None;
    }

    // A reference into a temporary would dangle
    Option<T&> as_ref() && = delete;
    Option<const T&> as_ref() const && = delete;
    Option<T&> as_mut() && = delete;
};

// Option<T&> - a nullable mutable borrow, stored as a raw pointer
// @safe
template<typename T>
class Option<T&> {
private:
    T* ptr;

public:
    Option() : ptr(nullptr) {}
    Option(None_t) : ptr(nullptr) {}
    Option(T& ref) : ptr(&ref) {}

    Option(const Option& other) = default;
    Option& operator=(const Option& other) = default;

    bool is_some() const { return ptr != nullptr; }
    bool is_none() const { return ptr == nullptr; }
    explicit operator bool() const { return ptr != nullptr; }

    // @lifetime: (&'a) -> &'a T
    T& unwrap() const {
        return expect("Called unwrap on None");
    }

    // @lifetime: (&'a) -> &'a T
    T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    template<typename F>
    auto map(F&& f) const -> Option<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (ptr) {
            return Option<U>(f(*ptr));
        }
        return Option<U>(None);
    }

    // Take the borrow out, leaving None
    Option<T&> take() {
        Option<T&> result(*this);
        ptr = nullptr;
        return result;
    }

    bool contains(const T& other) const {
        return ptr && (*ptr == other);
    }
};

// Option<const T&> - a nullable shared borrow
// @safe
template<typename T>
class Option<const T&> {
private:
    const T* ptr;

public:
    Option() : ptr(nullptr) {}
    Option(None_t) : ptr(nullptr) {}
    Option(const T& ref) : ptr(&ref) {}

    Option(const Option& other) = default;
    Option& operator=(const Option& other) = default;

    bool is_some() const { return ptr != nullptr; }
    bool is_none() const { return ptr == nullptr; }
    explicit operator bool() const { return ptr != nullptr; }

    // @lifetime: (&'a) -> &'a const T
    const T& unwrap() const {
        return expect("Called unwrap on None");
    }

    // @lifetime: (&'a) -> &'a const T
    const T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    template<typename F>
    auto map(F&& f) const -> Option<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (ptr) {
            return Option<U>(f(*ptr));
        }
        return Option<U>(None);
    }

    bool contains(const T& other) const {
        return ptr && (*ptr == other);
    }
};

// @safe
template<typename T>
// @lifetime: owned
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

template<typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.is_none() || rhs.is_none()) {
        return lhs.is_none() && rhs.is_none();
    }
    return lhs.as_ref().unwrap() == rhs.as_ref().unwrap();
}

template<typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
    return !(lhs == rhs);
}

} // namespace rclist

#endif // RCLIST_OPTION_HPP
