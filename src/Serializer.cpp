
#include "Serializer.hpp"
#include "Buffer.hpp"

#include <cstring>
#include <sstream>

namespace {

std::string indexedTag(const std::string& tag, size_t index)
{
    std::stringstream s;
    s << tag << '[' << (index + 1) << ']';
    return s.str();
}

void checkNoAttributes(const xmlserdes::xml::Element& element, const xmlserdes::Path& path)
{
    std::vector<std::string> names = xmlserdes::xml::getAttributeNames(element);
    for (std::vector<std::string>::const_iterator i = names.begin(), end = names.end(); i != end; ++i)
        if (*i != "xmlns" && i->compare(0, 6, "xmlns:") != 0)
            throw xmlserdes::UnexpectedAttributeError(*i, path);
}

void checkChildTag(const xmlserdes::xml::Element& child, const std::string& containedTag, const xmlserdes::Path& path)
{
    std::string tag = xmlserdes::xml::getTag(child);
    if (tag != containedTag)
        throw xmlserdes::UnexpectedElementError("Expected element '" + containedTag + "' but found '" + tag + "'", tag, path);
}

std::string encodeBuffer(const xmlserdes::TypeDescriptor& type, const void* value)
{
    size_t size = type.getSize(value);
    return xmlserdes::encodeBase64(size ? type.getItem(value, 0) : nullptr, size * type.stride);
}

std::vector<char> decodeBuffer(const std::string& text, size_t stride, const xmlserdes::Path& path)
{
    std::vector<char> data;
    if (!xmlserdes::decodeBase64(text, data))
        throw xmlserdes::ParseError(text, "base64 data", path);
    if (!xmlserdes::checkStride(data.size(), stride))
        throw xmlserdes::ShapeError(data.size(), stride, path);
    return data;
}

void decodeBuffer(const xmlserdes::TypeDescriptor& type, const std::string& text, void* value, const xmlserdes::Path& path)
{
    std::vector<char> data = decodeBuffer(text, type.stride, path);
    void* target = type.resize(value, data.size() / type.stride);
    if (!data.empty())
        memcpy(target, &data[0], data.size());
}

size_t getPackedSize(const std::vector<xmlserdes::ElementDescriptor>& fields)
{
    size_t size = 0;
    for (std::vector<xmlserdes::ElementDescriptor>::const_iterator i = fields.begin(), end = fields.end(); i != end; ++i)
    {
        if (i->type.kind != xmlserdes::TypeDescriptor::AtomicKind || !i->type.size)
            throw xmlserdes::ConfigurationError("Field '" + i->tag + "' of type " + i->type.typeName + " cannot be packed into a binary record");
        size += i->type.size;
    }
    return size;
}

size_t getPackedSize(const xmlserdes::Descriptor& descriptor)
{
    size_t size = getPackedSize(descriptor.getAttributes()) + getPackedSize(descriptor.getElements());
    if (!size)
        throw xmlserdes::ConfigurationError("A binary record requires at least one field");
    return size;
}

void packFields(const std::vector<xmlserdes::ElementDescriptor>& fields, const void* record, std::vector<char>& data)
{
    for (std::vector<xmlserdes::ElementDescriptor>::const_iterator i = fields.begin(), end = fields.end(); i != end; ++i)
    {
        const char* field = (const char*)i->getField(record);
        data.insert(data.end(), field, field + i->type.size);
    }
}

const char* unpackFields(const std::vector<xmlserdes::ElementDescriptor>& fields, const char* data, void* record)
{
    for (std::vector<xmlserdes::ElementDescriptor>::const_iterator i = fields.begin(), end = fields.end(); i != end; ++i)
    {
        memcpy(i->getField(record), data, i->type.size);
        data += i->type.size;
    }
    return data;
}

// records are packed field by field in declaration order, attributes first, without padding
std::string encodeRecords(const xmlserdes::TypeDescriptor& type, const void* value)
{
    const xmlserdes::Descriptor& descriptor = type.getDescriptor();
    size_t packedSize = getPackedSize(descriptor);
    size_t size = type.getSize(value);
    std::vector<char> data;
    data.reserve(size * packedSize);
    for (size_t i = 0; i < size; ++i)
    {
        const void* record = type.getItem(value, i);
        packFields(descriptor.getAttributes(), record, data);
        packFields(descriptor.getElements(), record, data);
    }
    return xmlserdes::encodeBase64(data.empty() ? nullptr : &data[0], data.size());
}

void decodeRecords(const xmlserdes::TypeDescriptor& type, const std::string& text, void* value, const xmlserdes::Path& path)
{
    const xmlserdes::Descriptor& descriptor = type.getDescriptor();
    size_t packedSize = getPackedSize(descriptor);
    std::vector<char> data = decodeBuffer(text, packedSize, path);
    size_t size = data.size() / packedSize;
    char* target = (char*)type.resize(value, size);
    const char* source = data.empty() ? nullptr : &data[0];
    for (size_t i = 0; i < size; ++i)
    {
        source = unpackFields(descriptor.getAttributes(), source, target + i * type.stride);
        source = unpackFields(descriptor.getElements(), source, target + i * type.stride);
    }
}

}

namespace xmlserdes {

std::string encodeText(const TypeDescriptor& type, const void* value, const Path& path)
{
    std::string text;
    if (!type.toText(type, value, text))
        throw ValueError("Value cannot be encoded as " + type.typeName, path);
    if (!xml::isValidText(text))
        throw ValueError("Value contains control characters that cannot be written to XML", path);
    return text;
}

void decodeText(const TypeDescriptor& type, const std::string& text, void* value, const Path& path)
{
    if (!type.fromText(type, value, text))
        throw ParseError(text, type.typeName, path);
}

xml::Element encode(const TypeDescriptor& type, const void* value, const std::string& tag, Path& path)
{
    switch (type.kind)
    {
    case TypeDescriptor::AtomicKind:
        {
            xml::Element element = xml::createElement(tag);
            xml::setText(element, encodeText(type, value, path));
            return element;
        }
    case TypeDescriptor::ListKind:
        {
            xml::Element element = xml::createElement(tag);
            for (size_t i = 0, size = type.getSize(value); i < size; ++i)
            {
                path.push_back(indexedTag(type.containedTag, i));
                xml::appendChild(element, encode(*type.contained, type.getItem(value, i), type.containedTag, path));
                path.pop_back();
            }
            return element;
        }
    case TypeDescriptor::InstanceKind:
        return type.getDescriptor().serialize(value, tag, path);
    case TypeDescriptor::NumericVectorKind:
        {
            xml::Element element = xml::createElement(tag);
            if (type.encoding == TypeDescriptor::BinaryEncoding)
                xml::setText(element, encodeBuffer(type, value));
            else
            {
                std::string text;
                for (size_t i = 0, size = type.getSize(value); i < size; ++i)
                {
                    if (i)
                        text.push_back(',');
                    text.append(encodeText(type, type.getItem(value, i), path));
                }
                xml::setText(element, text);
            }
            return element;
        }
    case TypeDescriptor::RecordVectorKind:
        {
            xml::Element element = xml::createElement(tag);
            if (type.encoding == TypeDescriptor::BinaryEncoding)
                xml::setText(element, encodeRecords(type, value));
            else
            {
                const Descriptor& descriptor = type.getDescriptor();
                for (size_t i = 0, size = type.getSize(value); i < size; ++i)
                {
                    path.push_back(indexedTag(type.containedTag, i));
                    xml::appendChild(element, descriptor.serialize(type.getItem(value, i), type.containedTag, path));
                    path.pop_back();
                }
            }
            return element;
        }
    }
    throw ConfigurationError("Unknown type descriptor kind");
}

void decode(const TypeDescriptor& type, const xml::Element& element, void* value, Path& path)
{
    switch (type.kind)
    {
    case TypeDescriptor::AtomicKind:
        checkNoAttributes(element, path);
        checkNoChildren(element, path);
        decodeText(type, xml::getText(element), value, path);
        return;
    case TypeDescriptor::ListKind:
        {
            checkNoAttributes(element, path);
            checkNoText(element, path);
            type.resize(value, 0);
            std::vector<const xml::Element*> children = xml::getChildren(element);
            for (size_t i = 0; i < children.size(); ++i)
            {
                checkChildTag(*children[i], type.containedTag, path);
                path.push_back(indexedTag(type.containedTag, i));
                decode(*type.contained, *children[i], type.addItem(value), path);
                path.pop_back();
            }
            return;
        }
    case TypeDescriptor::InstanceKind:
        type.getDescriptor().deserialize(element, value, path);
        return;
    case TypeDescriptor::NumericVectorKind:
        {
            checkNoAttributes(element, path);
            checkNoChildren(element, path);
            std::string text = xml::getText(element);
            if (type.encoding == TypeDescriptor::BinaryEncoding)
            {
                decodeBuffer(type, text, value, path);
                return;
            }
            std::vector<std::string> items = splitList(text);
            char* target = (char*)type.resize(value, items.size());
            for (size_t i = 0; i < items.size(); ++i)
                decodeText(type, items[i], target + i * type.stride, path);
            return;
        }
    case TypeDescriptor::RecordVectorKind:
        {
            checkNoAttributes(element, path);
            if (type.encoding == TypeDescriptor::BinaryEncoding)
            {
                checkNoChildren(element, path);
                decodeRecords(type, xml::getText(element), value, path);
                return;
            }
            checkNoText(element, path);
            const Descriptor& descriptor = type.getDescriptor();
            std::vector<const xml::Element*> children = xml::getChildren(element);
            char* target = (char*)type.resize(value, children.size());
            for (size_t i = 0; i < children.size(); ++i)
            {
                checkChildTag(*children[i], type.containedTag, path);
                path.push_back(indexedTag(type.containedTag, i));
                descriptor.deserialize(*children[i], target + i * type.stride, path);
                path.pop_back();
            }
            return;
        }
    }
    throw ConfigurationError("Unknown type descriptor kind");
}

void checkTag(const xml::Element& element, const std::string& expectedTag)
{
    std::string tag = xml::getTag(element);
    if (tag != expectedTag)
        throw UnexpectedElementError("Expected element '" + expectedTag + "' but found '" + tag + "'", tag, Path(1, tag));
}

void checkNoText(const xml::Element& element, const Path& path)
{
    std::string text = trim(xml::getText(element));
    if (!text.empty())
        throw UnexpectedElementError("Unexpected text '" + text + "'", "#text", path);
}

void checkNoChildren(const xml::Element& element, const Path& path)
{
    std::vector<const xml::Element*> children = xml::getChildren(element);
    if (!children.empty())
    {
        std::string tag = xml::getTag(*children.front());
        throw UnexpectedElementError("Unexpected element '" + tag + "' in text content", tag, path);
    }
}

}
