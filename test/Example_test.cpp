
#include "../src/Example/Building.hpp"

#include <gtest/gtest.h>

namespace {

const char* buildingXml = R"(<building-description>
  <name>house</name>
  <rooms>
    <room>
    <dimensions>5.75,4.0,2.25</dimensions>
    <wall-colour>blue</wall-colour>
    <contents>
      <furniture type="chair"><material>wood</material><count>3</count></furniture>
      <furniture type="table"><material>plastic</material><count>1</count></furniture>
    </contents>
    </room>
    <room>
    <dimensions>2.15,3.0,1.875</dimensions>
    <wall-colour>red</wall-colour>
    <contents>
      <furniture type="lamp"><material>steel</material><count>6</count></furniture>
    </contents>
    </room>
  </rooms>
</building-description>)";

}

TEST(Example, fromXml)
{
    BuildingDescription building = BuildingDescription::fromXmlString(buildingXml, "building-description");
    EXPECT_EQ(building.name, "house");
    ASSERT_EQ(building.rooms.size(), 2);

    const Room& living = building.rooms[0];
    std::vector<double> dimensions = {5.75, 4.0, 2.25};
    EXPECT_EQ(living.dimensions, dimensions);
    EXPECT_EQ(living.wallColour, "blue");
    ASSERT_EQ(living.contents.size(), 2);
    EXPECT_EQ(living.contents[0].type, "chair");
    EXPECT_EQ(living.contents[0].material, "wood");
    EXPECT_EQ(living.contents[0].count, 3);
    EXPECT_EQ(living.contents[1].type, "table");

    const Room& study = building.rooms[1];
    EXPECT_EQ(study.dimensions[2], 1.875);
    EXPECT_EQ(study.wallColour, "red");
    ASSERT_EQ(study.contents.size(), 1);
    EXPECT_EQ(study.contents[0].count, 6);
}

TEST(Example, toXml)
{
    BuildingDescription building = BuildingDescription::fromXmlString(buildingXml);
    EXPECT_EQ(building.toXmlString(),
        "<building-description>"
        "<name>house</name>"
        "<rooms>"
        "<room>"
        "<dimensions>5.75,4.0,2.25</dimensions>"
        "<wall-colour>blue</wall-colour>"
        "<contents>"
        "<furniture type=\"chair\"><material>wood</material><count>3</count></furniture>"
        "<furniture type=\"table\"><material>plastic</material><count>1</count></furniture>"
        "</contents>"
        "</room>"
        "<room>"
        "<dimensions>2.15,3.0,1.875</dimensions>"
        "<wall-colour>red</wall-colour>"
        "<contents>"
        "<furniture type=\"lamp\"><material>steel</material><count>6</count></furniture>"
        "</contents>"
        "</room>"
        "</rooms>"
        "</building-description>");
}

TEST(Example, Descriptor)
{
    const xmlserdes::ElementDescriptor* wallColour = Room::xmlDescriptor().find("wall-colour");
    ASSERT_NE(wallColour, nullptr);
    EXPECT_EQ(wallColour->fieldName, "wall_colour");
    EXPECT_EQ(Room::xmlDescriptor().find("dimensions")->type.kind, xmlserdes::TypeDescriptor::NumericVectorKind);
    EXPECT_EQ(Room::xmlDescriptor().find("contents")->type.containedTag, "furniture");
}
