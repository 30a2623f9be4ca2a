
#include "Descriptor.hpp"
#include "Serializer.hpp"

#include <set>

namespace {

bool isNamespaceDeclaration(const std::string& name)
{
    return name == "xmlns" || name.compare(0, 6, "xmlns:") == 0;
}

// a missing list or record vector decodes as empty, a missing atomic may have a default
bool isRequired(const xmlserdes::TypeDescriptor& type)
{
    switch (type.kind)
    {
    case xmlserdes::TypeDescriptor::ListKind:
    case xmlserdes::TypeDescriptor::RecordVectorKind:
        return false;
    case xmlserdes::TypeDescriptor::AtomicKind:
        return !type.hasDefault;
    default:
        return true;
    }
}

const xmlserdes::ElementDescriptor* findDescriptor(const std::vector<xmlserdes::ElementDescriptor>& descriptors, const std::string& tag)
{
    for (std::vector<xmlserdes::ElementDescriptor>::const_iterator i = descriptors.begin(), end = descriptors.end(); i != end; ++i)
        if (i->tag == tag)
            return &*i;
    return nullptr;
}

}

namespace xmlserdes {

Descriptor::Descriptor(const std::vector<ElementDescriptor>& descriptors)
{
    std::set<std::string> tags;
    for (std::vector<ElementDescriptor>::const_iterator i = descriptors.begin(), end = descriptors.end(); i != end; ++i)
    {
        const ElementDescriptor& descriptor = *i;
        if (!tags.insert(descriptor.tag).second)
            throw ConfigurationError("Duplicate tag '" + descriptor.tag + "'");
        if (descriptor.isAttribute)
            _attributes.push_back(descriptor);
        else
            _elements.push_back(descriptor);
    }
}

const ElementDescriptor* Descriptor::find(const std::string& tag) const
{
    const ElementDescriptor* result = findDescriptor(_attributes, tag);
    if (!result)
        result = findDescriptor(_elements, tag);
    return result;
}

const ElementDescriptor* Descriptor::findField(const std::string& fieldName) const
{
    for (std::vector<ElementDescriptor>::const_iterator i = _attributes.begin(), end = _attributes.end(); i != end; ++i)
        if (i->fieldName == fieldName)
            return &*i;
    for (std::vector<ElementDescriptor>::const_iterator i = _elements.begin(), end = _elements.end(); i != end; ++i)
        if (i->fieldName == fieldName)
            return &*i;
    return nullptr;
}

std::vector<std::string> Descriptor::getTags() const
{
    std::vector<std::string> result;
    for (std::vector<ElementDescriptor>::const_iterator i = _attributes.begin(), end = _attributes.end(); i != end; ++i)
        result.push_back(i->tag);
    for (std::vector<ElementDescriptor>::const_iterator i = _elements.begin(), end = _elements.end(); i != end; ++i)
        result.push_back(i->tag);
    return result;
}

xml::Element Descriptor::serialize(const void* object, const std::string& tag) const
{
    Path path(1, tag);
    return serialize(object, tag, path);
}

xml::Element Descriptor::serialize(const void* object, const std::string& tag, Path& path) const
{
    xml::Element element = xml::createElement(tag);
    for (std::vector<ElementDescriptor>::const_iterator i = _attributes.begin(), end = _attributes.end(); i != end; ++i)
    {
        const ElementDescriptor& attribute = *i;
        path.push_back("@" + attribute.tag);
        xml::setAttribute(element, attribute.tag, encodeText(attribute.type, attribute.getField(object), path));
        path.pop_back();
    }
    for (std::vector<ElementDescriptor>::const_iterator i = _elements.begin(), end = _elements.end(); i != end; ++i)
    {
        const ElementDescriptor& child = *i;
        path.push_back(child.tag);
        xml::appendChild(element, encode(child.type, child.getField(object), child.tag, path));
        path.pop_back();
    }
    return element;
}

void Descriptor::deserialize(const xml::Element& element, void* object) const
{
    Path path(1, xml::getTag(element));
    deserialize(element, object, path);
}

void Descriptor::deserialize(const xml::Element& element, void* object, Path& path) const
{
    std::vector<std::string> names = xml::getAttributeNames(element);
    for (std::vector<std::string>::const_iterator i = names.begin(), end = names.end(); i != end; ++i)
        if (!isNamespaceDeclaration(*i) && !findDescriptor(_attributes, *i))
            throw UnexpectedAttributeError(*i, path);

    std::vector<std::string> attributeTexts(_attributes.size());
    for (size_t index = 0; index < _attributes.size(); ++index)
    {
        const ElementDescriptor& attribute = _attributes[index];
        if (!xml::getAttribute(element, attribute.tag, attributeTexts[index]))
        {
            if (!attribute.type.hasDefault)
                throw MissingAttributeError(attribute.tag, path);
            attributeTexts[index] = attribute.type.defaultText;
        }
    }

    std::vector<const xml::Element*> matches(_elements.size(), nullptr);
    std::vector<std::string> unexpected;
    std::vector<const xml::Element*> children = xml::getChildren(element);
    for (std::vector<const xml::Element*>::const_iterator i = children.begin(), end = children.end(); i != end; ++i)
    {
        std::string tag = xml::getTag(**i);
        size_t index = 0;
        for (; index < _elements.size(); ++index)
            if (_elements[index].tag == tag)
                break;
        if (index == _elements.size() || matches[index])
            unexpected.push_back(tag);
        else
            matches[index] = *i;
    }
    std::vector<std::string> missing;
    for (size_t index = 0; index < _elements.size(); ++index)
        if (!matches[index] && isRequired(_elements[index].type))
            missing.push_back(_elements[index].tag);
    if (!unexpected.empty())
        throw UnexpectedElementError("Unexpected child elements " + compareTags(missing, unexpected), unexpected.front(), path);
    if (!missing.empty())
        throw MissingElementError(missing.front(), "Missing child elements " + compareTags(missing, unexpected), path);
    checkNoText(element, path);

    for (size_t index = 0; index < _attributes.size(); ++index)
    {
        const ElementDescriptor& attribute = _attributes[index];
        path.push_back("@" + attribute.tag);
        decodeText(attribute.type, attributeTexts[index], attribute.getField(object), path);
        path.pop_back();
    }

    for (size_t index = 0; index < _elements.size(); ++index)
    {
        const ElementDescriptor& child = _elements[index];
        void* field = child.getField(object);
        if (!matches[index])
        {
            if (child.type.kind == TypeDescriptor::AtomicKind)
            {
                path.push_back(child.tag);
                decodeText(child.type, child.type.defaultText, field, path);
                path.pop_back();
            }
            else
                child.type.resize(field, 0);
            continue;
        }
        path.push_back(child.tag);
        decode(child.type, *matches[index], field, path);
        path.pop_back();
    }
}

}
