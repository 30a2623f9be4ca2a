
#pragma once

#include "Descriptor.hpp"
#include "Xml.hpp"

#include <string>
#include <utility>

namespace xmlserdes {

std::string encodeText(const TypeDescriptor& type, const void* value, const Path& path);
void decodeText(const TypeDescriptor& type, const std::string& text, void* value, const Path& path);

xml::Element encode(const TypeDescriptor& type, const void* value, const std::string& tag, Path& path);
void decode(const TypeDescriptor& type, const xml::Element& element, void* value, Path& path);

void checkTag(const xml::Element& element, const std::string& expectedTag);
void checkNoText(const xml::Element& element, const Path& path);
void checkNoChildren(const xml::Element& element, const Path& path);

template <typename T>
xml::Element toXml(const T& value, const std::string& tag, const TypeSpec<T>& type)
{
    Path path(1, tag);
    return encode(type.getDescriptor(), &value, tag, path);
}

template <typename T>
xml::Element toXml(const T& value, const std::string& tag)
{
    return toXml(value, tag, resolve<T>());
}

template <typename T>
xml::Element toXml(const T& value)
{
    const char* tag = getDefaultTag<T>();
    if (!tag)
        throw ConfigurationError(std::string("Type '") + typeid(T).name() + "' has no default tag");
    return toXml(value, tag);
}

template <typename T>
T fromXml(const xml::Element& element, const TypeSpec<T>& type)
{
    T result = T();
    Path path(1, xml::getTag(element));
    decode(type.getDescriptor(), element, &result, path);
    return result;
}

template <typename T>
T fromXml(const xml::Element& element)
{
    return fromXml<T>(element, resolve<T>());
}

template <typename T>
T fromXml(const xml::Element& element, const std::string& expectedTag, const TypeSpec<T>& type)
{
    checkTag(element, expectedTag);
    return fromXml<T>(element, type);
}

template <typename T>
T fromXml(const xml::Element& element, const std::string& expectedTag)
{
    checkTag(element, expectedTag);
    return fromXml<T>(element);
}

// object is only assigned when decoding succeeds
template <typename T>
void fromXml(const xml::Element& element, T& object)
{
    T result = fromXml<T>(element);
    object = std::move(result);
}

template <typename T>
std::string toXmlString(const T& value, const std::string& tag)
{
    return xml::toString(toXml(value, tag));
}

template <typename T>
std::string toXmlString(const T& value)
{
    return xml::toString(toXml(value));
}

template <typename T>
T fromXmlString(const std::string& data)
{
    return fromXml<T>(xml::parse(data));
}

template <typename T>
T fromXmlString(const std::string& data, const std::string& expectedTag)
{
    return fromXml<T>(xml::parse(data), expectedTag);
}

}
