#include <jnibridge/value.h>
#include <jnibridge/object.h>
#include <jnibridge/throwable.h>
#include <sstream>

using namespace jnibridge;

bool Value::AsBool() const {
    if(IsBool()) {
        return std::get<bool>(data);
    } else if(IsInt()) {
        return std::get<jlong>(data) != 0;
    } else if(IsDouble()) {
        return std::get<jdouble>(data) != 0;
    }
    throw TypeError("Can't convert " + TypeName() + " to bool");
}

jlong Value::AsInt() const {
    if(IsInt()) {
        return std::get<jlong>(data);
    } else if(IsBool()) {
        return std::get<bool>(data) ? 1 : 0;
    } else if(IsDouble()) {
        return (jlong)std::get<jdouble>(data);
    }
    throw TypeError("Can't convert " + TypeName() + " to int");
}

jdouble Value::AsDouble() const {
    if(IsDouble()) {
        return std::get<jdouble>(data);
    } else if(IsInt()) {
        return (jdouble)std::get<jlong>(data);
    } else if(IsBool()) {
        return std::get<bool>(data) ? 1.0 : 0.0;
    }
    throw TypeError("Can't convert " + TypeName() + " to float");
}

const std::string & Value::AsString() const {
    if(!IsString()) {
        throw TypeError("Can't convert " + TypeName() + " to str");
    }
    return std::get<std::string>(data);
}

const std::shared_ptr<Object> & Value::AsObject() const {
    if(!IsObject()) {
        throw TypeError(TypeName() + " is not a Java object");
    }
    return std::get<std::shared_ptr<Object>>(data);
}

const Value::Sequence & Value::AsSequence() const {
    if(!IsSequence()) {
        throw TypeError(TypeName() + " is not a sequence");
    }
    return std::get<Sequence>(data);
}

std::string Value::TypeName() const {
    switch (data.index()) {
    case 0:
        return "None";
    case 1:
        return "bool";
    case 2:
        return "int";
    case 3:
        return "float";
    case 4:
        return "str";
    case 5:
        return "Java object";
    default:
        return "sequence";
    }
}

std::string Value::ToString() const {
    std::ostringstream ss;
    if(IsNull()) {
        ss << "None";
    } else if(IsBool()) {
        ss << (std::get<bool>(data) ? "True" : "False");
    } else if(IsInt()) {
        ss << std::get<jlong>(data);
    } else if(IsDouble()) {
        ss << std::get<jdouble>(data);
    } else if(IsString()) {
        ss << std::get<std::string>(data);
    } else if(IsObject()) {
        ss << "<Java object at " << (void*)std::get<std::shared_ptr<Object>>(data)->GetHandle() << ">";
    } else {
        ss << "[";
        auto&& seq = std::get<Sequence>(data);
        for(size_t i = 0; i < seq.size(); i++) {
            if(i) {
                ss << ", ";
            }
            ss << seq[i].ToString();
        }
        ss << "]";
    }
    return ss.str();
}

bool Value::operator==(const Value & other) const {
    if(IsObject() && other.IsObject()) {
        // Identity of the reference, not of the wrapper
        return *AsObject() == *other.AsObject();
    }
    return data == other.data;
}
