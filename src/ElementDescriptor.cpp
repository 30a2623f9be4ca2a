
#include "ElementDescriptor.hpp"

namespace xmlserdes {

std::string fieldNameFromTag(const std::string& tag)
{
    std::string result = !tag.empty() && tag[0] == '@' ? tag.substr(1) : tag;
    for (std::string::iterator i = result.begin(), end = result.end(); i != end; ++i)
        if (*i == '-')
            *i = '_';
    return result;
}

ElementDescriptor parseElementDescriptor(const std::string& tag, const std::string& fieldName, const TypeDescriptor& type, const std::shared_ptr<const FieldAccessor>& accessor)
{
    ElementDescriptor result;
    result.isAttribute = !tag.empty() && tag[0] == '@';
    result.tag = result.isAttribute ? tag.substr(1) : tag;
    if (!isValidTag(result.tag))
        throw ConfigurationError("Invalid tag '" + tag + "'");
    result.fieldName = fieldName.empty() ? fieldNameFromTag(tag) : fieldName;
    if (!accessor)
        throw ConfigurationError("No member given for field '" + result.fieldName + "'");
    if (result.isAttribute && type.kind != TypeDescriptor::AtomicKind)
        throw ConfigurationError("Attribute '" + result.tag + "' requires an atomic type, not " + type.typeName);
    result.type = type;
    result.accessor = accessor;
    return result;
}

}
