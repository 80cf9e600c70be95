#ifndef RCLIST_HPP
#define RCLIST_HPP

// rclist - linked lists with explicit ownership
//
// Three lists, each built on a different ownership model:
// - Stack<T>:          exclusive ownership (Option<Box<Node>>)
// - PersistentList<T>: shared immutable ownership (Option<Rc<Node>>)
// - Deque<T>:          shared mutable ownership with runtime borrow
//                      checking (Option<Rc<RefCell<Node>>>)
//
// The ownership primitives they are built from are usable on their own.

#include "rclist/option.hpp"
#include "rclist/box.hpp"
#include "rclist/rc.hpp"
#include "rclist/refcell.hpp"

#include "rclist/stack.hpp"
#include "rclist/persistent_list.hpp"
#include "rclist/deque.hpp"

#endif // RCLIST_HPP
