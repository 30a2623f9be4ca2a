
#pragma once

#include "ElementDescriptor.hpp"
#include "Xml.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace xmlserdes {

class Descriptor
{
public:
    Descriptor() {}
    explicit Descriptor(const std::vector<ElementDescriptor>& descriptors);

    template <typename C>
    static Descriptor create(std::initializer_list<Field<C>> fields)
    {
        std::vector<ElementDescriptor> descriptors;
        for (typename std::initializer_list<Field<C>>::const_iterator i = fields.begin(), end = fields.end(); i != end; ++i)
            descriptors.push_back(i->getDescriptor());
        return Descriptor(descriptors);
    }

    const std::vector<ElementDescriptor>& getAttributes() const { return _attributes; }
    const std::vector<ElementDescriptor>& getElements() const { return _elements; }

    const ElementDescriptor* find(const std::string& tag) const;
    const ElementDescriptor* findField(const std::string& fieldName) const;

    std::vector<std::string> getTags() const;

    xml::Element serialize(const void* object, const std::string& tag) const;
    xml::Element serialize(const void* object, const std::string& tag, Path& path) const;

    // decodes in place, a value error in a later field leaves earlier fields already assigned
    void deserialize(const xml::Element& element, void* object) const;
    void deserialize(const xml::Element& element, void* object, Path& path) const;

private:
    std::vector<ElementDescriptor> _attributes;
    std::vector<ElementDescriptor> _elements;
};

}
