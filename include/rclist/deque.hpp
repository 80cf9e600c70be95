#ifndef RCLIST_DEQUE_HPP
#define RCLIST_DEQUE_HPP

#include <utility>  // for std::move
#include "option.hpp"
#include "rc.hpp"
#include "refcell.hpp"

// Deque<T> - A doubly-linked deque with shared, runtime-checked nodes
//
// Every node is held in an Rc<RefCell<Node>>. A node is owned by whichever
// of the head slot, the tail slot, its predecessor's next link and its
// successor's prev link designate it, so between operations every node has
// a strong count of exactly two. Node contents are only touched through
// RefCell borrows; an incompatible borrow throws instead of aliasing.
//
// Guarantees:
// - O(1) push/pop/peek at both ends
// - Mutual-inverse links: a.next == b  <=>  b.prev == a
// - Peek guards keep the endpoint node borrowed until they are destroyed
// - Destruction unlinks node by node, so the next/prev reference cycles
//   never keep a node alive
// - Single-threaded only

// @safe
namespace rclist {

template<typename T>
class Deque;

namespace deque {

template<typename T>
struct Node;

template<typename T>
using NodePtr = Rc<RefCell<Node<T>>>;

template<typename T>
using Link = Option<NodePtr<T>>;

template<typename T>
struct Node {
    T elem;
    Link<T> next;
    Link<T> prev;

    explicit Node(T value) : elem(std::move(value)), next(), prev() {}

    static NodePtr<T> make(T value) {
        return NodePtr<T>::make(Node(std::move(value)));
    }
};

// Consuming iterator: next() pops the front, next_back() pops the back.
// The two ends meet when the owned deque runs empty.
template<typename T>
class IntoIter {
private:
    Deque<T> list_;

public:
    explicit IntoIter(Deque<T>&& list) : list_(std::move(list)) {}

    // @lifetime: owned
    Option<T> next() {
        return list_.pop_front();
    }

    // @lifetime: owned
    Option<T> next_back() {
        return list_.pop_back();
    }
};

} // namespace deque

namespace detail {
struct DequeAudit;
}

template<typename T>
class Deque {
private:
    using Node = deque::Node<T>;
    using NodePtr = deque::NodePtr<T>;
    using Link = deque::Link<T>;

    Link head_;
    Link tail_;

    friend struct detail::DequeAudit;

    // The node must already be unlinked from the deque and its neighbours
    static T into_elem(NodePtr node) {
        Option<RefCell<Node>> cell = node.try_unwrap();
        Node detached = cell.expect("Deque<T>: popped node is still shared").into_inner();
        return std::move(detached.elem);
    }

public:
    Deque() : head_(), tail_() {}

    // @lifetime: owned
    static Deque<T> make() {
        return Deque<T>();
    }

    Deque(const Deque&) = delete;
    Deque& operator=(const Deque&) = delete;

    Deque(Deque&& other) noexcept
        : head_(std::move(other.head_)), tail_(std::move(other.tail_)) {}

    Deque& operator=(Deque&& other) {
        if (this != &other) {
            clear();
            head_ = std::move(other.head_);
            tail_ = std::move(other.tail_);
        }
        return *this;
    }

    // Dropping head_ and tail_ alone would leave every inner node owned by
    // its neighbours
    ~Deque() {
        clear();
    }

    // The old endpoint is the only existing node written to, and it is
    // borrowed before anything changes, so a live peek guard on it makes the
    // push throw without touching the deque.
    void push_front(T value) {
        NodePtr new_node = Node::make(std::move(value));
        if (head_.is_some()) {
            const NodePtr& old_head = head_.as_ref().unwrap();
            old_head->borrow_mut()->prev = Some(new_node.clone());
            new_node->borrow_mut()->next = head_.take();
            head_ = Some(std::move(new_node));
        } else {
            tail_ = Some(new_node.clone());
            head_ = Some(std::move(new_node));
        }
    }

    void push_back(T value) {
        NodePtr new_node = Node::make(std::move(value));
        if (tail_.is_some()) {
            const NodePtr& old_tail = tail_.as_ref().unwrap();
            old_tail->borrow_mut()->next = Some(new_node.clone());
            new_node->borrow_mut()->prev = tail_.take();
            tail_ = Some(std::move(new_node));
        } else {
            head_ = Some(new_node.clone());
            tail_ = Some(std::move(new_node));
        }
    }

    // @lifetime: owned
    Option<T> pop_front() {
        if (head_.is_none()) {
            return None;
        }
        check_unborrowed(head_);
        check_unborrowed(head_.as_ref().unwrap()->borrow()->next);

        NodePtr node = head_.take().unwrap();
        Link next = node->borrow_mut()->next.take();
        if (next.is_some()) {
            NodePtr new_head = next.unwrap();
            new_head->borrow_mut()->prev.take();
            head_ = Some(std::move(new_head));
        } else {
            tail_.take();
        }
        return Some(into_elem(std::move(node)));
    }

    // @lifetime: owned
    Option<T> pop_back() {
        if (tail_.is_none()) {
            return None;
        }
        check_unborrowed(tail_);
        check_unborrowed(tail_.as_ref().unwrap()->borrow()->prev);

        NodePtr node = tail_.take().unwrap();
        Link prev = node->borrow_mut()->prev.take();
        if (prev.is_some()) {
            NodePtr new_tail = prev.unwrap();
            new_tail->borrow_mut()->next.take();
            tail_ = Some(std::move(new_tail));
        } else {
            head_.take();
        }
        return Some(into_elem(std::move(node)));
    }

    // @lifetime: (&'a) -> Option<Ref<'a, T>>
    Option<Ref<T>> peek_front() const {
        return peek(head_);
    }

    // @lifetime: (&'a) -> Option<Ref<'a, T>>
    Option<Ref<T>> peek_back() const {
        return peek(tail_);
    }

    // @lifetime: (&'a) -> Option<RefMut<'a, T>>
    Option<RefMut<T>> peek_front_mut() const {
        return peek_mut(head_);
    }

    // @lifetime: (&'a) -> Option<RefMut<'a, T>>
    Option<RefMut<T>> peek_back_mut() const {
        return peek_mut(tail_);
    }

    // Consume the deque into a double-ended iterator
    // @lifetime: owned
    deque::IntoIter<T> into_iter() && {
        return deque::IntoIter<T>(std::move(*this));
    }

private:
    static Option<Ref<T>> peek(const Link& end) {
        if (end.is_none()) {
            return None;
        }
        const NodePtr& node = end.as_ref().unwrap();
        return Some(Ref<Node>::map(node->borrow(),
                                   [](const Node& n) -> const T& { return n.elem; }));
    }

    static Option<RefMut<T>> peek_mut(const Link& end) {
        if (end.is_none()) {
            return None;
        }
        const NodePtr& node = end.as_ref().unwrap();
        return Some(RefMut<Node>::map(node->borrow_mut(),
                                      [](Node& n) -> T& { return n.elem; }));
    }

    // Throws the cell's BorrowMutError if a guard still borrows the node.
    // Pops run this on every node they relink before the first write.
    static void check_unborrowed(const Link& link) {
        if (link.is_some()) {
            RefMut<Node> probe = link.as_ref().unwrap()->borrow_mut();
            (void)probe;
        }
    }

    void clear() {
        while (pop_front().is_some()) {
        }
    }
};

} // namespace rclist

#endif // RCLIST_DEQUE_HPP
