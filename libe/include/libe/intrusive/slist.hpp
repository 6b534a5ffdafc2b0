#pragma once

#include <cstddef>
#include <iterator>

namespace elib::intrusive {

template<class T>
struct SListNode {
    T* next = nullptr;
};

template<class T>
class SListIterator {
public:
    using value_type = T;
    using difference_type = std::ptrdiff_t;

    SListIterator() : node(nullptr) {}

    explicit SListIterator(T* node) : node(node) {}

    T& operator*() const { return *node; }

    T* operator->() const { return node; }

    SListIterator& operator++() {
        node = node->next;
        return *this;
    }

    SListIterator operator++(int) {
        auto current = *this;
        node = node->next;
        return current;
    }

    bool operator==(const SListIterator& other) const = default;

private:
    T* node;
};

// Singly linked list threaded through nodes owned by the caller.
// T must expose a `T* next` member, typically by deriving from SListNode<T>.
// Positions are expressed as the node before the one affected; nullptr means the head.
template<class T>
class SList {
public:
    SList() : head(nullptr) {}

    SList(SList&& other) : head(other.head) {
        other.head = nullptr;
    }

    SList& operator=(SList&& other) {
        head = other.head;
        other.head = nullptr;
        return *this;
    }

    SList(const SList&) = delete;

    SList& operator=(const SList&) = delete;

    bool empty() const {
        return head == nullptr;
    }

    T* front() const {
        return head;
    }

    void pushFront(T& node) {
        node.next = head;
        head = &node;
    }

    T* popFront() {
        if (head == nullptr) {
            return nullptr;
        }

        auto node = head;
        head = node->next;
        node->next = nullptr;
        return node;
    }

    void insertAfter(T* position, T& node) {
        if (position == nullptr) {
            pushFront(node);
            return;
        }
        node.next = position->next;
        position->next = &node;
    }

    T* eraseAfter(T* position) {
        if (position == nullptr) {
            return popFront();
        }

        auto node = position->next;
        if (node != nullptr) {
            position->next = node->next;
            node->next = nullptr;
        }
        return node;
    }

    std::size_t size() const {
        auto count = std::size_t(0);
        for (auto node = head; node != nullptr; node = node->next) {
            count++;
        }
        return count;
    }

    SListIterator<T> begin() const {
        return SListIterator<T>{head};
    }

    SListIterator<T> end() const {
        return SListIterator<T>{nullptr};
    }

private:
    T* head;
};

} // namespace elib::intrusive
