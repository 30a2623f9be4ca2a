
#include "../src/ElementDescriptor.hpp"
#include "../src/Serializer.hpp"

#include <gtest/gtest.h>

namespace {

struct Rectangle
{
    int32_t width;
    int32_t height;
    std::vector<int32_t> corners;
};

}

TEST(ElementDescriptor, fieldNameFromTag)
{
    EXPECT_EQ(xmlserdes::fieldNameFromTag("width"), "width");
    EXPECT_EQ(xmlserdes::fieldNameFromTag("wall-colour"), "wall_colour");
    EXPECT_EQ(xmlserdes::fieldNameFromTag("@product-id"), "product_id");
}

TEST(ElementDescriptor, FromPair)
{
    xmlserdes::Field<Rectangle> field("width", &Rectangle::width);
    const xmlserdes::ElementDescriptor& descriptor = field.getDescriptor();
    EXPECT_EQ(descriptor.tag, "width");
    EXPECT_FALSE(descriptor.isAttribute);
    EXPECT_EQ(descriptor.fieldName, "width");
    EXPECT_EQ(descriptor.type.kind, xmlserdes::TypeDescriptor::AtomicKind);

    Rectangle rect;
    rect.width = 42;
    rect.height = 100;
    EXPECT_EQ(*(const int32_t*)descriptor.getField((const void*)&rect), 42);

    xmlserdes::Path path(1, descriptor.tag);
    xmlserdes::xml::Element element = xmlserdes::encode(descriptor.type, descriptor.getField((const void*)&rect), descriptor.tag, path);
    EXPECT_EQ(xmlserdes::xml::toString(element), "<width>42</width>");

    Rectangle result;
    result.width = 0;
    xmlserdes::decode(descriptor.type, element, descriptor.getField((void*)&result), path);
    EXPECT_EQ(result.width, 42);
}

TEST(ElementDescriptor, FromTriple)
{
    xmlserdes::Field<Rectangle> field("wd", "width", &Rectangle::width);
    EXPECT_EQ(field.getDescriptor().tag, "wd");
    EXPECT_EQ(field.getDescriptor().fieldName, "width");

    xmlserdes::Field<Rectangle> typed("corner-widths", &Rectangle::corners, xmlserdes::list<int32_t>("wd"));
    EXPECT_EQ(typed.getDescriptor().fieldName, "corner_widths");
    EXPECT_EQ(typed.getDescriptor().type.kind, xmlserdes::TypeDescriptor::ListKind);
    EXPECT_EQ(typed.getDescriptor().type.containedTag, "wd");

    xmlserdes::Field<Rectangle> full("corner-widths", "corners", &Rectangle::corners, xmlserdes::numericVector<int32_t>());
    EXPECT_EQ(full.getDescriptor().fieldName, "corners");
    EXPECT_EQ(full.getDescriptor().type.kind, xmlserdes::TypeDescriptor::NumericVectorKind);
}

TEST(ElementDescriptor, Attribute)
{
    xmlserdes::Field<Rectangle> field("@height", &Rectangle::height);
    EXPECT_EQ(field.getDescriptor().tag, "height");
    EXPECT_TRUE(field.getDescriptor().isAttribute);
    EXPECT_EQ(field.getDescriptor().fieldName, "height");
}

TEST(ElementDescriptor, ConfigurationError)
{
    typedef xmlserdes::Field<Rectangle> Field;
    EXPECT_THROW(Field("@corners", &Rectangle::corners, xmlserdes::numericVector<int32_t>()), xmlserdes::ConfigurationError);
    EXPECT_THROW(Field("@corners", &Rectangle::corners, xmlserdes::list<int32_t>("wd")), xmlserdes::ConfigurationError);
    EXPECT_THROW(Field("@", &Rectangle::width), xmlserdes::ConfigurationError);
    EXPECT_THROW(Field("", &Rectangle::width), xmlserdes::ConfigurationError);
    EXPECT_THROW(Field("1st", &Rectangle::width), xmlserdes::ConfigurationError);
    EXPECT_THROW(Field("with space", &Rectangle::width), xmlserdes::ConfigurationError);
    EXPECT_THROW(Field("width", (int32_t Rectangle::*)nullptr), xmlserdes::ConfigurationError);
    // no default tag for the items of a plain integer list
    EXPECT_THROW(Field("corners", &Rectangle::corners), xmlserdes::ConfigurationError);
}
