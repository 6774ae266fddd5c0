#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <jni.h>

namespace jnibridge {
    class Reaper;
    class ENV;

    // A jni reference held by the host
    // Owned references are global references released exactly once,
    // borrowed references are never released by their holder
    class Object {
        std::atomic<jobject> handle;
        std::shared_ptr<Reaper> reaper;
    public:
        // Takes ownership of a global reference
        Object(jobject handle, std::shared_ptr<Reaper> reaper);
        // Borrows a reference owned elsewhere
        explicit Object(jobject handle);
        Object(const Object&) = delete;
        Object& operator=(const Object&) = delete;
        virtual ~Object();

        jobject GetHandle() const {
            return handle.load();
        }
        bool IsOwned() const {
            return reaper != nullptr;
        }
        bool IsReleased() const {
            return handle.load() == nullptr;
        }
        // Releases the reference, a second call does nothing
        void Release();

        bool operator==(const Object& other) const {
            return GetHandle() == other.GetHandle();
        }
        bool operator!=(const Object& other) const {
            return !(*this == other);
        }
    };

    class Class : public Object {
    public:
        using Object::Object;
        jclass GetHandle() const {
            return (jclass)Object::GetHandle();
        }
        // Name in dotted form, e.g. java.lang.String
        std::string GetName(ENV& env) const;
        // Type signature, e.g. Ljava/lang/String; or I
        std::string GetSignature(ENV& env) const;
    };
}
