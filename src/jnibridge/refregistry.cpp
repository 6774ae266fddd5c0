#include <jnibridge/refregistry.h>
#include <jnibridge/throwable.h>
#include <string>

using namespace jnibridge;

RefRegistry &RefRegistry::Instance() {
    static RefRegistry registry;
    return registry;
}

jlong RefRegistry::Create(std::shared_ptr<void> value) {
    if(!value) {
        throw JavaError("Cannot create a reference to nothing");
    }
    std::lock_guard<std::mutex> lock(mtx);
    auto id = next++;
    entries[id].value = value;
    return id;
}

jlong RefRegistry::CreateAndLock(std::shared_ptr<void> value) {
    auto id = Create(value);
    Lock(id);
    return id;
}

std::shared_ptr<void> RefRegistry::Get(jlong id) {
    std::lock_guard<std::mutex> lock(mtx);
    auto f = entries.find(id);
    if(f == entries.end()) {
        throw JavaError("Unknown reference " + std::to_string(id));
    }
    auto value = f->second.value.lock();
    if(!value) {
        entries.erase(f);
        throw JavaError("The value of reference " + std::to_string(id) + " is gone");
    }
    return value;
}

void RefRegistry::Lock(jlong id) {
    auto value = Get(id);
    std::lock_guard<std::mutex> lock(mtx);
    auto f = entries.find(id);
    if(f == entries.end()) {
        throw JavaError("Unknown reference " + std::to_string(id));
    }
    f->second.locks.push_back(std::move(value));
}

void RefRegistry::Unlock(jlong id) {
    std::shared_ptr<void> last;
    std::lock_guard<std::mutex> lock(mtx);
    auto f = entries.find(id);
    if(f == entries.end() || f->second.locks.empty()) {
        throw JavaError("Reference " + std::to_string(id) + " is not locked");
    }
    // Destroyed after the mutex got released
    last = std::move(f->second.locks.back());
    f->second.locks.pop_back();
}

size_t RefRegistry::LockCount(jlong id) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto f = entries.find(id);
    return f != entries.end() ? f->second.locks.size() : 0;
}

void RefRegistry::Remove(jlong id) {
    std::vector<std::shared_ptr<void>> locks;
    std::lock_guard<std::mutex> lock(mtx);
    auto f = entries.find(id);
    if(f != entries.end()) {
        locks = std::move(f->second.locks);
        entries.erase(f);
    }
}
