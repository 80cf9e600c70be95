#ifndef RCLIST_DETAIL_DEQUE_AUDIT_HPP
#define RCLIST_DETAIL_DEQUE_AUDIT_HPP

#include <cstddef>
#include <vector>
#include "../deque.hpp"

// DequeAudit - walks a Deque<T> without modifying it and reports whether
// its structural invariants hold. Only shared borrows are taken, so the
// walk is rejected (BorrowError) while a peek_*_mut guard is alive.

namespace rclist {
namespace detail {

struct DequeReport {
    size_t forward_len;   // nodes reached from head through next
    size_t backward_len;  // nodes reached from tail through prev
    bool ends_open;       // head.prev and tail.next are absent
    bool links_inverse;   // a.next == b exactly when b.prev == a
    bool counts_exact;    // every node is owned by exactly two links

    bool ok() const {
        return ends_open && links_inverse && counts_exact &&
               forward_len == backward_len;
    }
};

struct DequeAudit {
    template<typename T>
    static DequeReport inspect(const Deque<T>& list) {
        using NodePtr = deque::NodePtr<T>;
        using Node = deque::Node<T>;

        DequeReport report{0, 0, true, true, true};
        if (list.head_.is_none() || list.tail_.is_none()) {
            report.ends_open = list.head_.is_none() && list.tail_.is_none();
            return report;
        }

        const NodePtr& head = list.head_.as_ref().unwrap();
        const NodePtr& tail = list.tail_.as_ref().unwrap();
        report.ends_open = head->borrow()->prev.is_none() &&
                           tail->borrow()->next.is_none();

        const NodePtr* cur = &head;
        while (true) {
            ++report.forward_len;
            if (cur->strong_count() != 2) {
                report.counts_exact = false;
            }
            Ref<Node> node = (*cur)->borrow();
            if (node->next.is_none()) {
                if (!NodePtr::ptr_eq(*cur, tail)) {
                    report.links_inverse = false;
                }
                break;
            }
            const NodePtr& next = node->next.as_ref().unwrap();
            {
                Ref<Node> next_node = next->borrow();
                if (next_node->prev.is_none() ||
                    !NodePtr::ptr_eq(next_node->prev.as_ref().unwrap(), *cur)) {
                    report.links_inverse = false;
                }
            }
            cur = &next;
        }

        cur = &tail;
        while (true) {
            ++report.backward_len;
            Ref<Node> node = (*cur)->borrow();
            if (node->prev.is_none()) {
                if (!NodePtr::ptr_eq(*cur, head)) {
                    report.links_inverse = false;
                }
                break;
            }
            cur = &node->prev.as_ref().unwrap();
        }
        return report;
    }

    // Copies of the elements, front to back
    template<typename T>
    static std::vector<T> values(const Deque<T>& list) {
        using Node = deque::Node<T>;
        std::vector<T> out;
        const deque::Link<T>* cur = &list.head_;
        while (cur->is_some()) {
            Ref<Node> node = cur->as_ref().unwrap()->borrow();
            out.push_back(node->elem);
            cur = &node->next;
        }
        return out;
    }
};

} // namespace detail
} // namespace rclist

#endif // RCLIST_DETAIL_DEQUE_AUDIT_HPP
