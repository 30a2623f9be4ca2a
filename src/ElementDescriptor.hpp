
#pragma once

#include "TypeDescriptor.hpp"

#include <memory>
#include <string>

namespace xmlserdes {

class FieldAccessor
{
public:
    virtual ~FieldAccessor() {}

    virtual void* getField(void* object) const = 0;
};

template <typename C, typename T>
class MemberAccessor : public FieldAccessor
{
public:
    explicit MemberAccessor(T C::*member)
        : _member(member)
    {
    }

    void* getField(void* object) const { return &(((C*)object)->*_member); }

private:
    T C::*_member;
};

struct ElementDescriptor
{
    std::string tag;
    bool isAttribute;
    std::string fieldName;
    TypeDescriptor type;
    std::shared_ptr<const FieldAccessor> accessor;

    ElementDescriptor()
        : isAttribute(false)
    {
    }

    void* getField(void* object) const { return accessor->getField(object); }
    const void* getField(const void* object) const { return accessor->getField(const_cast<void*>(object)); }
};

std::string fieldNameFromTag(const std::string& tag);

ElementDescriptor parseElementDescriptor(const std::string& tag, const std::string& fieldName, const TypeDescriptor& type, const std::shared_ptr<const FieldAccessor>& accessor);

template <typename C>
class Field
{
public:
    template <typename T>
    Field(const char* tag, T C::*member)
        : _descriptor(parseElementDescriptor(tag, std::string(), resolveType<T>(tag), makeAccessor(member)))
    {
    }

    template <typename T>
    Field(const char* tag, const char* fieldName, T C::*member)
        : _descriptor(parseElementDescriptor(tag, fieldName, resolveType<T>(tag), makeAccessor(member)))
    {
    }

    template <typename T>
    Field(const char* tag, T C::*member, const TypeSpec<T>& type)
        : _descriptor(parseElementDescriptor(tag, std::string(), type.getDescriptor(), makeAccessor(member)))
    {
    }

    template <typename T>
    Field(const char* tag, const char* fieldName, T C::*member, const TypeSpec<T>& type)
        : _descriptor(parseElementDescriptor(tag, fieldName, type.getDescriptor(), makeAccessor(member)))
    {
    }

    const ElementDescriptor& getDescriptor() const { return _descriptor; }

private:
    ElementDescriptor _descriptor;

private:
    template <typename T>
    static TypeDescriptor resolveType(const char* tag)
    {
        try
        {
            return resolve<T>().getDescriptor();
        }
        catch (const ConfigurationError& e)
        {
            throw ConfigurationError(std::string("Field '") + tag + "': " + e.getMessage());
        }
    }

    template <typename T>
    static std::shared_ptr<const FieldAccessor> makeAccessor(T C::*member)
    {
        if (!member)
            return std::shared_ptr<const FieldAccessor>();
        return std::make_shared<MemberAccessor<C, T>>(member);
    }
};

}
