
#pragma once

#include "Errors.hpp"
#include "Scalar.hpp"

#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace xmlserdes {

class Descriptor;
struct TypeDescriptor;

typedef bool (*to_text_t)(const TypeDescriptor& type, const void* value, std::string& text);
typedef bool (*from_text_t)(const TypeDescriptor& type, void* value, const std::string& text);
typedef size_t (*get_size_t)(const void* container);
typedef const void* (*get_item_t)(const void* container, size_t index);
typedef void* (*add_item_t)(void* container);
typedef void* (*resize_t)(void* container, size_t size);
typedef const Descriptor& (*get_descriptor_t)();

struct TypeDescriptor
{
    enum Kind
    {
        AtomicKind,
        ListKind,
        InstanceKind,
        NumericVectorKind,
        RecordVectorKind,
    };

    enum Encoding
    {
        TextEncoding,
        BinaryEncoding,
    };

    Kind kind;
    std::string typeName;

    // when AtomicKind, or the item codec when NumericVectorKind
    to_text_t toText;
    from_text_t fromText;
    const char* const* enumNames;
    bool hasDefault;
    std::string defaultText;
    size_t size; // bytes in a packed binary record, 0 if it cannot be packed

    // when ListKind or RecordVectorKind
    std::string containedTag;

    // when ListKind
    std::shared_ptr<const TypeDescriptor> contained;
    add_item_t addItem;

    // when ListKind, NumericVectorKind or RecordVectorKind
    get_size_t getSize;
    get_item_t getItem;
    resize_t resize;

    // when NumericVectorKind or RecordVectorKind
    Encoding encoding;
    size_t stride;

    // when InstanceKind or RecordVectorKind
    get_descriptor_t getDescriptor;

    TypeDescriptor()
        : kind(AtomicKind)
        , toText(nullptr)
        , fromText(nullptr)
        , enumNames(nullptr)
        , hasDefault(false)
        , size(0)
        , addItem(nullptr)
        , getSize(nullptr)
        , getItem(nullptr)
        , resize(nullptr)
        , encoding(TextEncoding)
        , stride(0)
        , getDescriptor(nullptr)
    {
    }
};

bool isValidTag(const std::string& tag);

TypeDescriptor makeListDescriptor(const TypeDescriptor& contained, const char* containedTag, get_size_t getSize, get_item_t getItem, add_item_t addItem, resize_t resize);
TypeDescriptor makeNumericVectorDescriptor(const TypeDescriptor& item, size_t stride, TypeDescriptor::Encoding encoding, get_size_t getSize, get_item_t getItem, resize_t resize);
TypeDescriptor makeRecordVectorDescriptor(const std::string& typeName, get_descriptor_t getDescriptor, const char* containedTag, size_t stride, TypeDescriptor::Encoding encoding, get_size_t getSize, get_item_t getItem, resize_t resize);

template <typename T>
class TypeSpec
{
public:
    explicit TypeSpec(const TypeDescriptor& descriptor)
        : _descriptor(descriptor)
    {
    }

    const TypeDescriptor& getDescriptor() const { return _descriptor; }

    TypeSpec withDefault(const T& value) const
    {
        if (_descriptor.kind != TypeDescriptor::AtomicKind)
            throw ConfigurationError("Default values require an atomic type, not " + _descriptor.typeName);
        TypeDescriptor descriptor = _descriptor;
        if (!descriptor.toText(descriptor, &value, descriptor.defaultText))
            throw ConfigurationError("Invalid default value for " + _descriptor.typeName);
        descriptor.hasDefault = true;
        return TypeSpec(descriptor);
    }

private:
    TypeDescriptor _descriptor;
};

namespace detail {

template <typename T>
struct ScalarCodec
{
    static bool toText(const TypeDescriptor&, const void* value, std::string& text)
    {
        text = xmlserdes::toText(*(const T*)value);
        return true;
    }

    static bool fromText(const TypeDescriptor&, void* value, const std::string& text)
    {
        return xmlserdes::fromText(text, *(T*)value);
    }
};

template <typename E>
struct EnumCodec
{
    static bool toText(const TypeDescriptor& type, const void* value, std::string& text)
    {
        return enumToText((int64_t)*(const E*)value, type.enumNames, text);
    }

    static bool fromText(const TypeDescriptor& type, void* value, const std::string& text)
    {
        int64_t result;
        if (!enumFromText(text, type.enumNames, result))
            return false;
        *(E*)value = (E)result;
        return true;
    }
};

template <typename T>
struct VectorAccess
{
    static_assert(!std::is_same<T, bool>::value, "std::vector<bool> cannot be addressed element-wise, use std::vector<uint8_t>");

    static size_t getSize(const void* container) { return ((const std::vector<T>*)container)->size(); }
    static const void* getItem(const void* container, size_t index) { return &(*(const std::vector<T>*)container)[index]; }

    static void* addItem(void* container)
    {
        std::vector<T>& vector = *(std::vector<T>*)container;
        vector.emplace_back();
        return &vector.back();
    }

    static void* resize(void* container, size_t size)
    {
        std::vector<T>& vector = *(std::vector<T>*)container;
        vector.resize(size);
        return vector.empty() ? nullptr : &vector[0];
    }
};

template <typename T>
class HasDescriptor
{
    template <typename U>
    static char test(typename std::enable_if<std::is_same<decltype(U::xmlDescriptor()), const Descriptor&>::value>::type*);
    template <typename U>
    static long test(...);

public:
    static const bool value = sizeof(test<T>(nullptr)) == sizeof(char);
};

template <typename T>
class HasDefaultTag
{
    template <typename U>
    static char test(typename std::enable_if<std::is_convertible<decltype(U::xmlDefaultTag()), const char*>::value>::type*);
    template <typename U>
    static long test(...);

public:
    static const bool value = sizeof(test<T>(nullptr)) == sizeof(char);
};

template <typename T>
const char* getDefaultTag(std::true_type) { return T::xmlDefaultTag(); }

template <typename T>
const char* getDefaultTag(std::false_type) { return nullptr; }

}

// nullptr if T declares no xmlDefaultTag()
template <typename T>
const char* getDefaultTag()
{
    return detail::getDefaultTag<T>(std::integral_constant<bool, detail::HasDefaultTag<T>::value>());
}

template <typename T>
TypeSpec<T> atomic()
{
    static_assert(IsScalar<T>::value, "atomic<T>() requires a scalar type");
    TypeDescriptor type;
    type.kind = TypeDescriptor::AtomicKind;
    type.typeName = getTypeName((const T*)nullptr);
    type.toText = &detail::ScalarCodec<T>::toText;
    type.fromText = &detail::ScalarCodec<T>::fromText;
    type.size = std::is_arithmetic<T>::value && !std::is_same<T, bool>::value ? sizeof(T) : 0;
    return TypeSpec<T>(type);
}

template <typename E>
TypeSpec<E> enumeration(const char* const* names, const std::string& typeName = "enumeration")
{
    static_assert(std::is_enum<E>::value, "enumeration<E>() requires an enum type");
    if (!names || !*names)
        throw ConfigurationError("Enumeration '" + typeName + "' has no names");
    TypeDescriptor type;
    type.kind = TypeDescriptor::AtomicKind;
    type.typeName = "member of " + typeName;
    type.toText = &detail::EnumCodec<E>::toText;
    type.fromText = &detail::EnumCodec<E>::fromText;
    type.enumNames = names;
    type.size = sizeof(E);
    return TypeSpec<E>(type);
}

// the descriptor table is fetched lazily so that recursive types resolve
template <typename T>
TypeSpec<T> instance()
{
    static_assert(detail::HasDescriptor<T>::value, "instance<T>() requires a static T::xmlDescriptor()");
    TypeDescriptor type;
    type.kind = TypeDescriptor::InstanceKind;
    type.typeName = typeid(T).name();
    type.getDescriptor = &T::xmlDescriptor;
    return TypeSpec<T>(type);
}

template <typename T>
TypeSpec<T> resolve();

template <typename T>
TypeSpec<std::vector<T>> list(const TypeSpec<T>& contained, const std::string& containedTag)
{
    return TypeSpec<std::vector<T>>(makeListDescriptor(contained.getDescriptor(), containedTag.c_str(),
        &detail::VectorAccess<T>::getSize, &detail::VectorAccess<T>::getItem,
        &detail::VectorAccess<T>::addItem, &detail::VectorAccess<T>::resize));
}

template <typename T>
TypeSpec<std::vector<T>> list(const std::string& containedTag)
{
    return list(resolve<T>(), containedTag);
}

template <typename T>
TypeSpec<std::vector<T>> list()
{
    TypeSpec<T> contained = resolve<T>();
    return TypeSpec<std::vector<T>>(makeListDescriptor(contained.getDescriptor(), getDefaultTag<T>(),
        &detail::VectorAccess<T>::getSize, &detail::VectorAccess<T>::getItem,
        &detail::VectorAccess<T>::addItem, &detail::VectorAccess<T>::resize));
}

template <typename T>
TypeSpec<std::vector<T>> numericVector(TypeDescriptor::Encoding encoding = TypeDescriptor::TextEncoding)
{
    static_assert(std::is_arithmetic<T>::value && !std::is_same<T, bool>::value, "numericVector<T>() requires a numeric type");
    return TypeSpec<std::vector<T>>(makeNumericVectorDescriptor(atomic<T>().getDescriptor(), sizeof(T), encoding,
        &detail::VectorAccess<T>::getSize, &detail::VectorAccess<T>::getItem, &detail::VectorAccess<T>::resize));
}

template <typename R>
TypeSpec<std::vector<R>> recordVector(const char* containedTag, TypeDescriptor::Encoding encoding = TypeDescriptor::TextEncoding)
{
    static_assert(std::is_trivially_copyable<R>::value, "recordVector<R>() requires a trivially copyable record type");
    static_assert(detail::HasDescriptor<R>::value, "recordVector<R>() requires a static R::xmlDescriptor()");
    return TypeSpec<std::vector<R>>(makeRecordVectorDescriptor(typeid(R).name(), &R::xmlDescriptor, containedTag, sizeof(R), encoding,
        &detail::VectorAccess<R>::getSize, &detail::VectorAccess<R>::getItem, &detail::VectorAccess<R>::resize));
}

template <typename R>
TypeSpec<std::vector<R>> recordVector(TypeDescriptor::Encoding encoding = TypeDescriptor::TextEncoding)
{
    return recordVector<R>(getDefaultTag<R>(), encoding);
}

namespace detail {

template <typename T, typename Enable = void>
struct DefaultSpec
{
    static TypeSpec<T> get()
    {
        throw ConfigurationError(std::string("Type '") + typeid(T).name() + "' is neither a scalar nor has an XML descriptor");
    }
};

template <typename T>
struct DefaultSpec<T, typename std::enable_if<IsScalar<T>::value>::type>
{
    static TypeSpec<T> get() { return atomic<T>(); }
};

template <typename T>
struct DefaultSpec<T, typename std::enable_if<HasDescriptor<T>::value>::type>
{
    static TypeSpec<T> get() { return instance<T>(); }
};

template <typename T>
struct DefaultSpec<std::vector<T>, void>
{
    static TypeSpec<std::vector<T>> get() { return list<T>(); }
};

}

template <typename T>
TypeSpec<T> resolve()
{
    return detail::DefaultSpec<T>::get();
}

}
