#pragma once
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <jni.h>

namespace jnibridge {
    // Hands out numeric ids for host values so that java code can refer to them
    // An id only stays valid while someone holds the value or while it is locked
    class RefRegistry {
        struct Entry {
            std::weak_ptr<void> value;
            // One strong reference per Lock
            std::vector<std::shared_ptr<void>> locks;
        };
        mutable std::mutex mtx;
        std::unordered_map<jlong, Entry> entries;
        jlong next = 1;

        std::shared_ptr<void> Get(jlong id);
    public:
        static RefRegistry & Instance();

        jlong Create(std::shared_ptr<void> value);
        jlong CreateAndLock(std::shared_ptr<void> value);
        // Throws JavaError if the id is unknown or its value is gone
        template<class T> std::shared_ptr<T> Redeem(jlong id) {
            return std::static_pointer_cast<T>(Get(id));
        }
        // Keeps the value alive until a matching Unlock
        void Lock(jlong id);
        void Unlock(jlong id);
        size_t LockCount(jlong id) const;
        // Forgets the id, locks included
        void Remove(jlong id);
    };
}
