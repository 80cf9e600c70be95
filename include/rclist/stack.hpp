#ifndef RCLIST_STACK_HPP
#define RCLIST_STACK_HPP

#include <cstddef>
#include <iterator>
#include <utility>
#include "box.hpp"
#include "option.hpp"

// Stack<T> - A singly-linked stack with exclusively owned nodes
//
// Each node is owned by exactly one Box: the stack's head slot or the
// previous node's next link. There is no aliasing, so no runtime borrow
// tracking is needed; peek_mut()/iter_mut() hand out plain references.
//
// Guarantees:
// - O(1) push/pop/peek
// - Destruction unlinks iteratively (no recursion on long stacks)
// - Move-only

// @safe
namespace rclist {

template<typename T>
class Stack;

namespace stack {

template<typename T>
struct Node {
    T elem;
    Option<Box<Node<T>>> next;

    explicit Node(T value) : elem(std::move(value)), next() {}
    Node(T value, Option<Box<Node<T>>> rest)
        : elem(std::move(value)), next(std::move(rest)) {}
};

// Borrowing iterator over shared references, front (top) to back
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

    // Rust-style: yields the next element or None at the end
    // @lifetime: (&'a) -> Option<&'a T>
    Option<const T&> next() {
        if (!next_) {
            return None;
        }
        const Node<T>* node = next_;
        advance();
        return Option<const T&>(node->elem);
    }

    reference operator*() const { return next_->elem; }
    pointer operator->() const { return &next_->elem; }

    Iter& operator++() { advance(); return *this; }
    Iter operator++(int) { Iter tmp = *this; advance(); return tmp; }

    bool operator==(const Iter& other) const { return next_ == other.next_; }
    bool operator!=(const Iter& other) const { return next_ != other.next_; }

    Iter begin() const { return *this; }
    Iter end() const { return Iter(nullptr); }

private:
    void advance() {
        next_ = next_->next.is_some() ? next_->next.as_ref().unwrap().get() : nullptr;
    }
};

// Borrowing iterator over mutable references
template<typename T>
class IterMut {
private:
    Node<T>* next_;

public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = T*;
    using reference = T&;

    explicit IterMut(Node<T>* first) : next_(first) {}

    // Each element is handed out at most once per traversal, so the
    // returned references never alias each other.
    // @lifetime: (&'a mut) -> Option<&'a mut T>
    Option<T&> next() {
        if (!next_) {
            return None;
        }
        Node<T>* node = next_;
        advance();
        return Option<T&>(node->elem);
    }

    reference operator*() const { return next_->elem; }
    pointer operator->() const { return &next_->elem; }

    IterMut& operator++() { advance(); return *this; }
    IterMut operator++(int) { IterMut tmp = *this; advance(); return tmp; }

    bool operator==(const IterMut& other) const { return next_ == other.next_; }
    bool operator!=(const IterMut& other) const { return next_ != other.next_; }

    IterMut begin() const { return *this; }
    IterMut end() const { return IterMut(nullptr); }

private:
    void advance() {
        next_ = next_->next.is_some() ? next_->next.as_mut().unwrap().get() : nullptr;
    }
};

// Consuming iterator: every next() pops the top element
template<typename T>
class IntoIter {
private:
    Stack<T> list_;

public:
    explicit IntoIter(Stack<T>&& list) : list_(std::move(list)) {}

    // @lifetime: owned
    Option<T> next() {
        return list_.pop();
    }
};

} // namespace stack

template<typename T>
class Stack {
private:
    using Node = stack::Node<T>;
    using Link = Option<Box<Node>>;

    Link head_;

    const Node* first() const {
        return head_.is_some() ? head_.as_ref().unwrap().get() : nullptr;
    }

    Node* first() {
        return head_.is_some() ? head_.as_mut().unwrap().get() : nullptr;
    }

    void clear() {
        Link cur = head_.take();
        while (cur.is_some()) {
            Box<Node> node = cur.unwrap();
            cur = node->next.take();
        }
    }

public:
    Stack() : head_() {}

    // @lifetime: owned
    static Stack<T> make() {
        return Stack<T>();
    }

    Stack(const Stack&) = delete;
    Stack& operator=(const Stack&) = delete;

    Stack(Stack&& other) noexcept : head_(other.head_.take()) {}

    Stack& operator=(Stack&& other) noexcept {
        if (this != &other) {
            clear();
            head_ = other.head_.take();
        }
        return *this;
    }

    ~Stack() {
        clear();
    }

    void push(T elem) {
        head_ = Some(Box<Node>::make(std::move(elem), head_.take()));
    }

    // @lifetime: owned
    Option<T> pop() {
        Link old = head_.take();
        if (old.is_none()) {
            return None;
        }
        Box<Node> node = old.unwrap();
        head_ = node->next.take();
        return Some(std::move(node->elem));
    }

    // Pops the whole node. Its next link is cleared, so the returned node
    // owns nothing but its element.
    // @lifetime: owned
    Option<Node> pop_node() {
        Link old = head_.take();
        if (old.is_none()) {
            return None;
        }
        Node node = old.unwrap().into_inner();
        head_ = node.next.take();
        return Some(std::move(node));
    }

    // @lifetime: (&'a) -> Option<&'a T>
    Option<const T&> peek() const {
        if (head_.is_none()) {
            return None;
        }
        return Option<const T&>(head_.as_ref().unwrap()->elem);
    }

    // @lifetime: (&'a mut) -> Option<&'a mut T>
    Option<T&> peek_mut() {
        if (head_.is_none()) {
            return None;
        }
        return Option<T&>(head_.as_mut().unwrap()->elem);
    }

    bool is_empty() const {
        return head_.is_none();
    }

    // @lifetime: (&'a) -> &'a
    stack::Iter<T> iter() const { return stack::Iter<T>(first()); }

    // @lifetime: (&'a mut) -> &'a mut
    stack::IterMut<T> iter_mut() { return stack::IterMut<T>(first()); }

    stack::Iter<T> begin() const { return iter(); }
    stack::Iter<T> end() const { return stack::Iter<T>(nullptr); }
    stack::IterMut<T> begin() { return iter_mut(); }
    stack::IterMut<T> end() { return stack::IterMut<T>(nullptr); }

    // @lifetime: owned
    stack::IntoIter<T> into_iter() && {
        return stack::IntoIter<T>(std::move(*this));
    }
};

} // namespace rclist

#endif // RCLIST_STACK_HPP
