// Test suite for rclist::Stack - singly-linked stack over Option<Box<Node>>

#include <rclist/stack.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using rclist::Some;
using rclist::Stack;

struct Person {
    std::string name;
    int age;

    bool operator==(const Person& other) const {
        return name == other.name && age == other.age;
    }
};

static int g_live_count = 0;

struct Tracker {
    int value;

    explicit Tracker(int v) : value(v) { ++g_live_count; }
    Tracker(const Tracker& other) : value(other.value) { ++g_live_count; }
    Tracker(Tracker&& other) noexcept : value(other.value) { ++g_live_count; }
    ~Tracker() { --g_live_count; }
};

void test_basics() {
    std::cout << "Testing push/pop..." << std::endl;

    Stack<int> list;
    assert(list.pop().is_none());
    assert(list.is_empty());

    list.push(1);
    list.push(2);
    list.push(3);

    assert(list.pop() == Some(3));
    assert(list.pop() == Some(2));

    list.push(4);
    list.push(5);

    assert(list.pop() == Some(5));
    assert(list.pop() == Some(4));
    assert(list.pop() == Some(1));
    assert(list.pop().is_none());
    assert(list.is_empty());

    std::cout << "  push/pop passed!" << std::endl;
}

void test_complex_type() {
    std::cout << "Testing non-trivial element type..." << std::endl;

    Stack<Person> list;
    list.push(Person{"Alice", 30});
    list.push(Person{"Bob", 25});
    list.push(Person{"Carol", 40});

    assert((list.pop() == Some(Person{"Carol", 40})));
    assert((list.pop() == Some(Person{"Bob", 25})));
    assert((list.pop() == Some(Person{"Alice", 30})));
    assert(list.pop().is_none());

    std::cout << "  Complex type passed!" << std::endl;
}

void test_pop_node() {
    std::cout << "Testing pop_node..." << std::endl;

    Stack<Person> list;
    list.push(Person{"Dave", 50});
    list.push(Person{"Eve", 60});

    auto node = list.pop_node().unwrap();
    assert((node.elem == Person{"Eve", 60}));
    assert(node.next.is_none());  // detached from the rest of the stack

    assert((list.pop_node().unwrap().elem == Person{"Dave", 50}));
    assert(list.pop_node().is_none());

    std::cout << "  pop_node passed!" << std::endl;
}

void test_peek_and_peek_mut() {
    std::cout << "Testing peek/peek_mut..." << std::endl;

    Stack<int> list;
    assert(list.peek().is_none());
    assert(list.peek_mut().is_none());

    list.push(10);
    list.push(20);
    list.push(30);

    assert(list.peek().contains(30));
    assert(list.peek_mut().contains(30));

    auto top = list.peek_mut();
    if (top.is_some()) {
        top.unwrap() = 100;
    }

    assert(list.peek().contains(100));
    assert(list.pop() == Some(100));
    assert(list.pop() == Some(20));
    assert(list.pop() == Some(10));
    assert(list.pop().is_none());

    std::cout << "  peek/peek_mut passed!" << std::endl;
}

void test_into_iter() {
    std::cout << "Testing into_iter..." << std::endl;

    Stack<int> list;
    list.push(1);
    list.push(2);
    list.push(3);

    auto iter = std::move(list).into_iter();
    assert(iter.next() == Some(3));
    assert(iter.next() == Some(2));
    assert(iter.next() == Some(1));
    assert(iter.next().is_none());
    assert(iter.next().is_none());

    std::cout << "  into_iter passed!" << std::endl;
}

void test_iter() {
    std::cout << "Testing iter..." << std::endl;

    Stack<int> list;
    list.push(1);
    list.push(2);
    list.push(3);

    auto iter = list.iter();
    assert(iter.next().contains(3));
    assert(iter.next().contains(2));
    assert(iter.next().contains(1));
    assert(iter.next().is_none());

    // The stack is untouched by borrowing iteration
    std::vector<int> seen;
    for (const int& x : list.iter()) {
        seen.push_back(x);
    }
    assert(seen == std::vector<int>({3, 2, 1}));

    const Stack<int>& view = list;
    seen.clear();
    for (const int& x : view) {
        seen.push_back(x);
    }
    assert(seen == std::vector<int>({3, 2, 1}));

    std::cout << "  iter passed!" << std::endl;
}

void test_iter_mut() {
    std::cout << "Testing iter_mut..." << std::endl;

    Stack<int> list;
    list.push(1);
    list.push(2);
    list.push(3);

    auto iter = list.iter_mut();
    for (auto x = iter.next(); x.is_some(); x = iter.next()) {
        x.unwrap() *= 10;
    }

    auto check = list.iter();
    assert(check.next().contains(30));
    assert(check.next().contains(20));
    assert(check.next().contains(10));
    assert(check.next().is_none());

    // Distinct elements can be held mutably at the same time
    auto pair = list.iter_mut();
    int& first = pair.next().unwrap();
    int& second = pair.next().unwrap();
    first = 100;
    second = 200;
    assert(list.peek().contains(100));

    for (int& x : list) {
        x += 1;
    }
    assert(list.pop() == Some(101));
    assert(list.pop() == Some(201));
    assert(list.pop() == Some(11));

    std::cout << "  iter_mut passed!" << std::endl;
}

void test_teardown() {
    std::cout << "Testing teardown..." << std::endl;

    g_live_count = 0;
    {
        Stack<Tracker> list;
        for (int i = 0; i < 200000; ++i) {
            list.push(Tracker(i));
        }
        assert(g_live_count == 200000);
    }
    assert(g_live_count == 0);

    {
        Stack<Tracker> a;
        Stack<Tracker> b;
        a.push(Tracker(1));
        b.push(Tracker(2));
        b.push(Tracker(3));
        a = std::move(b);
        assert(g_live_count == 2);
        assert(b.pop().is_none());
    }
    assert(g_live_count == 0);

    std::cout << "  Teardown passed!" << std::endl;
}

int main() {
    std::cout << "\n=== Stack<T> Test Suite ===" << std::endl;

    test_basics();
    test_complex_type();
    test_pop_node();
    test_peek_and_peek_mut();
    test_into_iter();
    test_iter();
    test_iter_mut();
    test_teardown();

    std::cout << "\n✅ All Stack tests passed!" << std::endl;
    return 0;
}
