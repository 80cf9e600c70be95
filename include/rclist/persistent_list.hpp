#ifndef RCLIST_PERSISTENT_LIST_HPP
#define RCLIST_PERSISTENT_LIST_HPP

#include <cstddef>
#include <iterator>
#include <utility>
#include "option.hpp"
#include "rc.hpp"

// PersistentList<T> - An immutable singly-linked list with shared tails
//
// prepend() and tail() never modify a node; they build a new list value
// that shares the existing nodes through Rc. Nothing is ever mutated through
// a shared link, so no RefCell is involved.
//
// Guarantees:
// - O(1) prepend/tail/head
// - Copying a list shares all of its nodes
// - Destruction frees the unshared prefix iteratively and stops at the
//   first node another list still owns

// @safe
namespace rclist {

namespace persistent {

template<typename T>
struct Node {
    T elem;
    Option<Rc<Node<T>>> next;

    Node(T value, Option<Rc<Node<T>>> rest)
        : elem(std::move(value)), next(std::move(rest)) {}
};

template<typename T>
class Iter {
private:
    const Node<T>* next_;

public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = const T&;

    explicit Iter(const Node<T>* first) : next_(first) {}

    // @lifetime: (&'a) -> Option<&'a T>
    Option<const T&> next() {
        if (!next_) {
            return None;
        }
        const Node<T>* node = next_;
        ++*this;
        return Option<const T&>(node->elem);
    }

    reference operator*() const { return next_->elem; }
    pointer operator->() const { return &next_->elem; }

    Iter& operator++() {
        next_ = next_->next.is_some() ? next_->next.as_ref().unwrap().get() : nullptr;
        return *this;
    }

    Iter operator++(int) { Iter tmp = *this; ++*this; return tmp; }

    bool operator==(const Iter& other) const { return next_ == other.next_; }
    bool operator!=(const Iter& other) const { return next_ != other.next_; }
};

} // namespace persistent

template<typename T>
class PersistentList {
private:
    using Node = persistent::Node<T>;
    using Link = Option<Rc<Node>>;

    Link head_;

    explicit PersistentList(Link head) : head_(std::move(head)) {}

    // Unwind the nodes this list is the last owner of
    void release() {
        Link cur = head_.take();
        while (cur.is_some()) {
            Option<Node> node = cur.as_mut().unwrap().try_unwrap();
            if (node.is_none()) {
                break;
            }
            cur = node.unwrap().next.take();
        }
    }

public:
    PersistentList() : head_() {}

    // @lifetime: owned
    static PersistentList<T> make() {
        return PersistentList<T>();
    }

    // Shares every node of `other`
    PersistentList(const PersistentList& other) : head_(other.head_) {}

    PersistentList(PersistentList&& other) noexcept : head_(other.head_.take()) {}

    PersistentList& operator=(const PersistentList& other) {
        if (this != &other) {
            Link incoming = other.head_;
            release();
            head_ = std::move(incoming);
        }
        return *this;
    }

    PersistentList& operator=(PersistentList&& other) noexcept {
        if (this != &other) {
            Link incoming = other.head_.take();
            release();
            head_ = std::move(incoming);
        }
        return *this;
    }

    ~PersistentList() {
        release();
    }

    // A new list with `elem` in front of this one
    // @lifetime: owned
    PersistentList prepend(T elem) const {
        return PersistentList(Some(Rc<Node>::make(std::move(elem), head_)));
    }

    // A new list without the first element; the tail of an empty list is empty
    // @lifetime: owned
    PersistentList tail() const {
        if (head_.is_none()) {
            return PersistentList();
        }
        return PersistentList(head_.as_ref().unwrap()->next);
    }

    // @lifetime: (&'a) -> Option<&'a T>
    Option<const T&> head() const {
        if (head_.is_none()) {
            return None;
        }
        return Option<const T&>(head_.as_ref().unwrap()->elem);
    }

    bool is_empty() const {
        return head_.is_none();
    }

    // @lifetime: (&'a) -> &'a
    persistent::Iter<T> iter() const {
        return persistent::Iter<T>(head_.is_some() ? head_.as_ref().unwrap().get() : nullptr);
    }

    persistent::Iter<T> begin() const { return iter(); }
    persistent::Iter<T> end() const { return persistent::Iter<T>(nullptr); }
};

} // namespace rclist

#endif // RCLIST_PERSISTENT_LIST_HPP
