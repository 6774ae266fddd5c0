#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <jni.h>

namespace jnibridge {
    class Object;

    // Host side value passed to or returned from java
    class Value {
    public:
        using Sequence = std::vector<Value>;
        using Variant = std::variant<std::nullptr_t, bool, jlong, jdouble, std::string, std::shared_ptr<Object>, Sequence>;
    private:
        Variant data;
    public:
        Value() : data(nullptr) {}
        Value(std::nullptr_t) : data(nullptr) {}
        Value(bool b) : data(b) {}
        template<class T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
        Value(T i) : data((jlong)i) {}
        template<class T, std::enable_if_t<std::is_floating_point<T>::value, int> = 0>
        Value(T d) : data((jdouble)d) {}
        Value(const char * str) : data(std::string(str)) {}
        Value(std::string str) : data(std::move(str)) {}
        template<class T, std::enable_if_t<std::is_base_of<Object, T>::value, int> = 0>
        Value(std::shared_ptr<T> obj) {
            if(obj) {
                data = std::shared_ptr<Object>(std::move(obj));
            } else {
                data = nullptr;
            }
        }
        Value(Sequence seq) : data(std::move(seq)) {}

        bool IsNull() const {
            return std::holds_alternative<std::nullptr_t>(data);
        }
        bool IsBool() const {
            return std::holds_alternative<bool>(data);
        }
        bool IsInt() const {
            return std::holds_alternative<jlong>(data);
        }
        bool IsDouble() const {
            return std::holds_alternative<jdouble>(data);
        }
        bool IsNumber() const {
            return IsBool() || IsInt() || IsDouble();
        }
        bool IsString() const {
            return std::holds_alternative<std::string>(data);
        }
        bool IsObject() const {
            return std::holds_alternative<std::shared_ptr<Object>>(data);
        }
        bool IsSequence() const {
            return std::holds_alternative<Sequence>(data);
        }
        // Everything but objects and sequences
        bool IsScalar() const {
            return !IsObject() && !IsSequence();
        }

        // Numeric accessors coerce between bool, integer and floating point
        bool AsBool() const;
        jlong AsInt() const;
        jdouble AsDouble() const;
        const std::string & AsString() const;
        const std::shared_ptr<Object> & AsObject() const;
        const Sequence & AsSequence() const;

        const Variant & GetVariant() const {
            return data;
        }
        // Used in error messages
        std::string TypeName() const;
        std::string ToString() const;

        bool operator==(const Value & other) const;
        bool operator!=(const Value & other) const {
            return !(*this == other);
        }
    };
}
