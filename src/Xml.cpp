
#include "Xml.hpp"
#include "Errors.hpp"

#include <nstd/Error.hpp>
#include <nstd/File.hpp>

namespace {

// the first four are escaped in text, all of them in attribute values
const char* _escapeStrings[] = { "&amp;", "&lt;", "&gt;", "&#13;", "&quot;", "&#9;", "&#10;" };
const char* _escapeChars = "&<>\r\"\t\n";

String toNstdString(const std::string& str)
{
    return String(str.c_str(), str.size());
}

std::string fromNstdString(const String& str)
{
    return std::string((const char*)str, str.length());
}

void write(const xmlserdes::xml::Element& element, std::string& output)
{
    std::string tag = fromNstdString(element.type);
    output.push_back('<');
    output.append(tag);
    for (HashMap<String, String>::Iterator i = element.attributes.begin(), end = element.attributes.end(); i != end; ++i)
    {
        output.push_back(' ');
        output.append(fromNstdString(i.key()));
        output.append("=\"");
        output.append(xmlserdes::xml::escape(fromNstdString(*i), true));
        output.push_back('"');
    }
    if (element.content.isEmpty())
    {
        output.append("/>");
        return;
    }
    output.push_back('>');
    for (List<Xml::Variant>::Iterator i = element.content.begin(), end = element.content.end(); i != end; ++i)
    {
        const Xml::Variant& variant = *i;
        if (variant.isElement())
            write(variant.toElement(), output);
        else if (variant.isText())
            output.append(xmlserdes::xml::escape(fromNstdString(variant.toString())));
    }
    output.append("</");
    output.append(tag);
    output.push_back('>');
}

}

namespace xmlserdes {
namespace xml {

Element createElement(const std::string& tag)
{
    Element element;
    element.type = toNstdString(tag);
    return element;
}

std::string getTag(const Element& element)
{
    return fromNstdString(element.type);
}

void setText(Element& element, const std::string& text)
{
    if (!text.empty())
        element.content.append(Xml::Variant(toNstdString(text)));
}

std::string getText(const Element& element)
{
    std::string result;
    for (List<Xml::Variant>::Iterator i = element.content.begin(), end = element.content.end(); i != end; ++i)
    {
        const Xml::Variant& variant = *i;
        if (variant.isText())
            result.append(fromNstdString(variant.toString()));
    }
    return result;
}

void setAttribute(Element& element, const std::string& name, const std::string& value)
{
    element.attributes.append(toNstdString(name), toNstdString(value));
}

bool getAttribute(const Element& element, const std::string& name, std::string& value)
{
    HashMap<String, String>::Iterator it = element.attributes.find(toNstdString(name));
    if (it == element.attributes.end())
        return false;
    value = fromNstdString(*it);
    return true;
}

std::vector<std::string> getAttributeNames(const Element& element)
{
    std::vector<std::string> result;
    for (HashMap<String, String>::Iterator i = element.attributes.begin(), end = element.attributes.end(); i != end; ++i)
        result.push_back(fromNstdString(i.key()));
    return result;
}

void appendChild(Element& parent, const Element& child)
{
    parent.content.append(Xml::Variant(child));
}

std::vector<const Element*> getChildren(const Element& element)
{
    std::vector<const Element*> result;
    for (List<Xml::Variant>::Iterator i = element.content.begin(), end = element.content.end(); i != end; ++i)
    {
        const Xml::Variant& variant = *i;
        if (variant.isElement())
            result.push_back(&variant.toElement());
    }
    return result;
}

std::vector<const Element*> findChildren(const Element& element, const std::string& tag)
{
    String type = toNstdString(tag);
    std::vector<const Element*> result;
    for (List<Xml::Variant>::Iterator i = element.content.begin(), end = element.content.end(); i != end; ++i)
    {
        const Xml::Variant& variant = *i;
        if (variant.isElement() && variant.toElement().type == type)
            result.push_back(&variant.toElement());
    }
    return result;
}

std::string escape(const std::string& text, bool attribute)
{
    std::string result;
    result.reserve(text.size());
    size_t escapeCount = attribute ? 7 : 4;
    for (std::string::const_iterator i = text.begin(), end = text.end(); i != end; ++i)
    {
        size_t j = 0;
        for (; j < escapeCount; ++j)
            if (*i == _escapeChars[j])
            {
                result.append(_escapeStrings[j]);
                break;
            }
        if (j == escapeCount)
            result.push_back(*i);
    }
    return result;
}

bool isValidText(const std::string& text)
{
    for (std::string::const_iterator i = text.begin(), end = text.end(); i != end; ++i)
    {
        unsigned char c = (unsigned char)*i;
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r')
            return false;
    }
    return true;
}

std::string toString(const Element& element)
{
    std::string result;
    write(element, result);
    return result;
}

Element parse(const std::string& data)
{
    Element element;
    Xml::Parser parser;
    if (!parser.parse(toNstdString(data), element))
        throw XmlError(fromNstdString(parser.getErrorString()), parser.getErrorLine());
    return element;
}

bool load(const std::string& file, Element& element, std::string& error)
{
    Xml::Parser parser;
    if (!parser.load(toNstdString(file), element))
        return (error = "Could not load file '" + file + "': " + fromNstdString(parser.getErrorString())), false;
    return true;
}

bool save(const Element& element, const std::string& file, std::string& error)
{
    File outputFile;
    if (!outputFile.open(toNstdString(file), File::writeFlag))
        return (error = fromNstdString(::Error::getErrorString())), false;
    if (!outputFile.write(toNstdString(toString(element))))
        return (error = fromNstdString(::Error::getErrorString())), false;
    return true;
}

}
}
