
#include "../src/Xml.hpp"
#include "../src/Errors.hpp"

#include <gtest/gtest.h>

TEST(Xml, escape)
{
    EXPECT_EQ(xmlserdes::xml::escape("a<b>&c"), "a&lt;b&gt;&amp;c");
    EXPECT_EQ(xmlserdes::xml::escape("say \"hi\""), "say \"hi\"");
    EXPECT_EQ(xmlserdes::xml::escape("say \"hi\"", true), "say &quot;hi&quot;");
    EXPECT_EQ(xmlserdes::xml::escape("a\tb\nc\r\n"), "a\tb\nc&#13;\n");
    EXPECT_EQ(xmlserdes::xml::escape("a\tb\nc\r\n", true), "a&#9;b&#10;c&#13;&#10;");
}

TEST(Xml, isValidText)
{
    EXPECT_TRUE(xmlserdes::xml::isValidText("tab\tline\nreturn\r"));
    EXPECT_TRUE(xmlserdes::xml::isValidText("caf\xc3\xa9"));
    EXPECT_FALSE(xmlserdes::xml::isValidText(std::string("nul\0", 4)));
    EXPECT_FALSE(xmlserdes::xml::isValidText("bell\x07"));
    EXPECT_FALSE(xmlserdes::xml::isValidText("escape\x1b"));
}

TEST(Xml, toString)
{
    xmlserdes::xml::Element furniture = xmlserdes::xml::createElement("furniture");
    xmlserdes::xml::setAttribute(furniture, "type", "chair");
    xmlserdes::xml::setAttribute(furniture, "label", "\"big\" & <soft>");
    xmlserdes::xml::Element name = xmlserdes::xml::createElement("name");
    xmlserdes::xml::setText(name, "Armchair");
    xmlserdes::xml::appendChild(furniture, name);
    xmlserdes::xml::appendChild(furniture, xmlserdes::xml::createElement("empty"));

    EXPECT_EQ(xmlserdes::xml::toString(furniture),
        "<furniture type=\"chair\" label=\"&quot;big&quot; &amp; &lt;soft&gt;\"><name>Armchair</name><empty/></furniture>");

    xmlserdes::xml::Element empty = xmlserdes::xml::createElement("value");
    xmlserdes::xml::setText(empty, "");
    EXPECT_EQ(xmlserdes::xml::toString(empty), "<value/>");
}

TEST(Xml, parse)
{
    xmlserdes::xml::Element element = xmlserdes::xml::parse(R"(<?xml version="1.0" encoding="UTF-8"?>
<room size="large">
  <wall-colour>blue</wall-colour>
  <furniture type="chair"/>
  <furniture type="table"/>
</room>)");

    EXPECT_EQ(xmlserdes::xml::getTag(element), "room");

    std::string value;
    EXPECT_TRUE(xmlserdes::xml::getAttribute(element, "size", value));
    EXPECT_EQ(value, "large");
    EXPECT_FALSE(xmlserdes::xml::getAttribute(element, "colour", value));

    std::vector<std::string> names = xmlserdes::xml::getAttributeNames(element);
    ASSERT_EQ(names.size(), 1);
    EXPECT_EQ(names[0], "size");

    std::vector<const xmlserdes::xml::Element*> children = xmlserdes::xml::getChildren(element);
    ASSERT_EQ(children.size(), 3);
    EXPECT_EQ(xmlserdes::xml::getTag(*children[0]), "wall-colour");
    EXPECT_EQ(xmlserdes::xml::getText(*children[0]), "blue");

    std::vector<const xmlserdes::xml::Element*> furniture = xmlserdes::xml::findChildren(element, "furniture");
    ASSERT_EQ(furniture.size(), 2);
    EXPECT_TRUE(xmlserdes::xml::getAttribute(*furniture[1], "type", value));
    EXPECT_EQ(value, "table");
}

TEST(Xml, parse_Error)
{
    EXPECT_THROW(xmlserdes::xml::parse("<room><name>house</room>"), xmlserdes::XmlError);
}

TEST(Xml, load_Error)
{
    xmlserdes::xml::Element element;
    std::string error;
    EXPECT_FALSE(xmlserdes::xml::load("does-not-exist.xml", element, error));
    EXPECT_FALSE(error.empty());
}
