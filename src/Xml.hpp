
#pragma once

#include <nstd/Document/Xml.hpp>

#include <string>
#include <vector>

namespace xmlserdes {
namespace xml {

typedef Xml::Element Element;

Element createElement(const std::string& tag);

std::string getTag(const Element& element);

void setText(Element& element, const std::string& text);

// concatenation of the text directly below element
std::string getText(const Element& element);

void setAttribute(Element& element, const std::string& name, const std::string& value);
bool getAttribute(const Element& element, const std::string& name, std::string& value);
std::vector<std::string> getAttributeNames(const Element& element);

void appendChild(Element& parent, const Element& child);
std::vector<const Element*> getChildren(const Element& element);
std::vector<const Element*> findChildren(const Element& element, const std::string& tag);

std::string escape(const std::string& text, bool attribute = false);

// false if text holds control characters an XML document cannot carry
bool isValidText(const std::string& text);

// compact, attributes keep their insertion order
std::string toString(const Element& element);

Element parse(const std::string& data);

bool load(const std::string& file, Element& element, std::string& error);
bool save(const Element& element, const std::string& file, std::string& error);

}
}
