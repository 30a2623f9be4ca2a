
#pragma once

#include "Serializer.hpp"

namespace xmlserdes {

template <typename T>
class Serializable
{
public:
    xml::Element toXml() const { return xmlserdes::toXml(static_cast<const T&>(*this)); }
    xml::Element toXml(const std::string& tag) const { return xmlserdes::toXml(static_cast<const T&>(*this), tag); }

    std::string toXmlString() const { return xml::toString(toXml()); }
    std::string toXmlString(const std::string& tag) const { return xml::toString(toXml(tag)); }

    static T fromXml(const xml::Element& element) { return xmlserdes::fromXml<T>(element); }
    static T fromXml(const xml::Element& element, const std::string& expectedTag) { return xmlserdes::fromXml<T>(element, expectedTag); }

    static T fromXmlString(const std::string& data) { return fromXml(xml::parse(data)); }
    static T fromXmlString(const std::string& data, const std::string& expectedTag) { return fromXml(xml::parse(data), expectedTag); }
};

}
