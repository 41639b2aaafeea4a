//          Copyright Tango Tango, Inc. 2020 - 2021.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          https://www.boost.org/LICENSE_1_0.txt)

#ifndef _SLOTH_LIST_ENTRY_H_
#define _SLOTH_LIST_ENTRY_H_

#include <utility>
#include <vector>
#include "../List.hpp"

namespace sloth::list {

/**
 * A list cell holding a value and a tail (which may be empty).
 */
template <class T>
class ListEntry final : public List<T>, public std::enable_shared_from_this<ListEntry<T>> {
public:
    ListEntry(const T& head, ListRef<T> tail);
    ~ListEntry() override;
    static ListRef<T> create(const T& head, ListRef<T> tail);

    ListRef<T> prepend(const T& elem) const override;
    ListRef<T> append(const T& elem) const override;
    bool is_empty() const override;
    std::size_t size() const override;
    std::optional<T> head() const override;
    ListRef<T> tail() const override;

private:
    T headValue;
    // Unlinked cell by cell on destruction so long lists don't recurse.
    mutable ListRef<T> tailRef;
    std::size_t memoizedSize;
};

template <class T>
ListRef<T> ListEntry<T>::create(const T& head, ListRef<T> tail) {
    return std::make_shared<ListEntry<T>>(head, tail);
}

template <class T>
ListEntry<T>::ListEntry(const T& head, ListRef<T> tail)
    : headValue(head)
    , tailRef(tail)
    , memoizedSize(tail == nullptr ? 1 : tail->size() + 1)
{}

template <class T>
ListEntry<T>::~ListEntry() {
    ListRef<T> next = std::move(tailRef);

    while(next != nullptr && next.use_count() == 1 && !next->is_empty()) {
        auto cell = static_cast<const ListEntry<T>*>(next.get());
        ListRef<T> after = std::move(cell->tailRef);
        next = std::move(after);
    }
}

template <class T>
ListRef<T> ListEntry<T>::prepend(const T& elem) const {
    return ListEntry<T>::create(elem, this->shared_from_this());
}

template <class T>
ListRef<T> ListEntry<T>::append(const T& elem) const {
    // Copy every cell up to the end of the list, then hang the new
    // element off the last copy. Sizes are fixed up on the way back.
    std::vector<const ListEntry<T>*> cells;
    const List<T>* current = this;

    while(!current->is_empty()) {
        auto cell = static_cast<const ListEntry<T>*>(current);
        cells.push_back(cell);
        current = cell->tailRef.get();
    }

    ListRef<T> rebuilt = ListEntry<T>::create(elem, List<T>::empty());
    for(auto it = cells.rbegin(); it != cells.rend(); ++it) {
        rebuilt = ListEntry<T>::create((*it)->headValue, rebuilt);
    }

    return rebuilt;
}

template <class T>
bool ListEntry<T>::is_empty() const {
    return false;
}

template <class T>
std::size_t ListEntry<T>::size() const {
    return memoizedSize;
}

template <class T>
std::optional<T> ListEntry<T>::head() const {
    return headValue;
}

template <class T>
ListRef<T> ListEntry<T>::tail() const {
    return tailRef;
}

} // namespace sloth::list

#endif
