
#include "../src/Serializable.hpp"

#include <gtest/gtest.h>

namespace {

struct Point : public xmlserdes::Serializable<Point>
{
    double x;
    double y;

    Point() : x(0.), y(0.) {}
    Point(double x, double y) : x(x), y(y) {}

    static const char* xmlDefaultTag() { return "point"; }

    static const xmlserdes::Descriptor& xmlDescriptor()
    {
        static const xmlserdes::Descriptor descriptor = xmlserdes::Descriptor::create<Point>({
            {"@x", &Point::x},
            {"@y", &Point::y},
        });
        return descriptor;
    }
};

struct Polygon : public xmlserdes::Serializable<Polygon>
{
    std::string name;
    std::vector<Point> points;

    static const xmlserdes::Descriptor& xmlDescriptor()
    {
        static const xmlserdes::Descriptor descriptor = xmlserdes::Descriptor::create<Polygon>({
            {"name", &Polygon::name},
            {"points", &Polygon::points},
        });
        return descriptor;
    }
};

}

TEST(Serializable, toXml)
{
    Point point(1.5, -2.);
    EXPECT_EQ(xmlserdes::xml::getTag(point.toXml()), "point");
    EXPECT_EQ(point.toXmlString(), "<point x=\"1.5\" y=\"-2.0\"/>");
    EXPECT_EQ(point.toXmlString("corner"), "<corner x=\"1.5\" y=\"-2.0\"/>");
}

TEST(Serializable, toXml_NoDefaultTag)
{
    Polygon polygon;
    EXPECT_THROW(polygon.toXml(), xmlserdes::ConfigurationError);
    EXPECT_EQ(polygon.toXmlString("polygon"), "<polygon><name/><points/></polygon>");
}

TEST(Serializable, fromXml)
{
    Point point = Point::fromXmlString("<point x=\"3\" y=\"4.25\"/>");
    EXPECT_EQ(point.x, 3.);
    EXPECT_EQ(point.y, 4.25);

    point = Point::fromXml(xmlserdes::xml::parse("<corner x=\"1\" y=\"2\"/>"), "corner");
    EXPECT_EQ(point.x, 1.);
    EXPECT_THROW(Point::fromXmlString("<corner x=\"1\" y=\"2\"/>", "point"), xmlserdes::UnexpectedElementError);
}

TEST(Serializable, RoundTrip)
{
    Polygon polygon;
    polygon.name = "triangle";
    polygon.points.push_back(Point(0., 0.));
    polygon.points.push_back(Point(1., 0.));
    polygon.points.push_back(Point(0.5, 0.75));

    std::string xml = polygon.toXmlString("polygon");
    EXPECT_EQ(xml, "<polygon><name>triangle</name><points><point x=\"0.0\" y=\"0.0\"/><point x=\"1.0\" y=\"0.0\"/><point x=\"0.5\" y=\"0.75\"/></points></polygon>");

    Polygon result = Polygon::fromXmlString(xml, "polygon");
    EXPECT_EQ(result.name, "triangle");
    ASSERT_EQ(result.points.size(), 3);
    EXPECT_EQ(result.points[2].x, 0.5);
    EXPECT_EQ(result.points[2].y, 0.75);
}
