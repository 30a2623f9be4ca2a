
#include "TypeDescriptor.hpp"

#include <cctype>

namespace {

bool isNameStartChar(char c)
{
    return isalpha((unsigned char)c) || c == '_';
}

bool isNameChar(char c)
{
    return isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.';
}

std::string getContainedTag(const char* containedTag, const std::string& typeName)
{
    if (!containedTag)
        throw xmlserdes::ConfigurationError("No contained tag given for items of type '" + typeName + "' and the type has no default tag");
    if (!xmlserdes::isValidTag(containedTag))
        throw xmlserdes::ConfigurationError(std::string("Invalid contained tag '") + containedTag + "'");
    return containedTag;
}

}

namespace xmlserdes {

bool isValidTag(const std::string& tag)
{
    if (tag.empty() || !isNameStartChar(tag[0]))
        return false;
    for (std::string::const_iterator i = tag.begin() + 1, end = tag.end(); i != end; ++i)
        if (!isNameChar(*i))
            return false;
    return true;
}

TypeDescriptor makeListDescriptor(const TypeDescriptor& contained, const char* containedTag, get_size_t getSize, get_item_t getItem, add_item_t addItem, resize_t resize)
{
    TypeDescriptor type;
    type.kind = TypeDescriptor::ListKind;
    type.typeName = "list of " + contained.typeName;
    type.containedTag = getContainedTag(containedTag, contained.typeName);
    type.contained = std::make_shared<TypeDescriptor>(contained);
    type.getSize = getSize;
    type.getItem = getItem;
    type.addItem = addItem;
    type.resize = resize;
    return type;
}

TypeDescriptor makeNumericVectorDescriptor(const TypeDescriptor& item, size_t stride, TypeDescriptor::Encoding encoding, get_size_t getSize, get_item_t getItem, resize_t resize)
{
    TypeDescriptor type;
    type.kind = TypeDescriptor::NumericVectorKind;
    type.typeName = "vector of " + item.typeName;
    type.toText = item.toText;
    type.fromText = item.fromText;
    type.encoding = encoding;
    type.stride = stride;
    type.getSize = getSize;
    type.getItem = getItem;
    type.resize = resize;
    return type;
}

TypeDescriptor makeRecordVectorDescriptor(const std::string& typeName, get_descriptor_t getDescriptor, const char* containedTag, size_t stride, TypeDescriptor::Encoding encoding, get_size_t getSize, get_item_t getItem, resize_t resize)
{
    TypeDescriptor type;
    type.kind = TypeDescriptor::RecordVectorKind;
    type.typeName = "record vector of " + typeName;
    if (encoding == TypeDescriptor::TextEncoding)
        type.containedTag = getContainedTag(containedTag, typeName);
    else if (containedTag && !isValidTag(containedTag))
        throw ConfigurationError(std::string("Invalid contained tag '") + containedTag + "'");
    type.getDescriptor = getDescriptor;
    type.encoding = encoding;
    type.stride = stride;
    type.getSize = getSize;
    type.getItem = getItem;
    type.resize = resize;
    return type;
}

}
