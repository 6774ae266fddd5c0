#pragma once
#include <deque>
#include <iterator>
#include <mutex>
#include <vector>

namespace jnibridge {
    // Many producers, drained by whoever holds a valid environment
    template<class T> class ConcurrentQueue {
        mutable std::mutex mtx;
        std::deque<T> items;
    public:
        void Push(T item) {
            std::lock_guard<std::mutex> lock(mtx);
            items.push_back(std::move(item));
        }

        bool TryPop(T& item) {
            std::lock_guard<std::mutex> lock(mtx);
            if(items.empty()) {
                return false;
            }
            item = std::move(items.front());
            items.pop_front();
            return true;
        }

        std::vector<T> DrainAll() {
            std::lock_guard<std::mutex> lock(mtx);
            std::vector<T> result(std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
            items.clear();
            return result;
        }

        size_t Size() const {
            std::lock_guard<std::mutex> lock(mtx);
            return items.size();
        }

        bool Empty() const {
            return Size() == 0;
        }
    };
}
