
#pragma once

#include "../XmlSerDes.hpp"

#include <string>
#include <vector>

struct Furniture
{
    std::string type;
    std::string material;
    int32_t count;

    Furniture() : count(0) {}

    static const char* xmlDefaultTag() { return "furniture"; }
    static const xmlserdes::Descriptor& xmlDescriptor();
};

struct Room
{
    std::vector<double> dimensions;
    std::string wallColour;
    std::vector<Furniture> contents;

    static const char* xmlDefaultTag() { return "room"; }
    static const xmlserdes::Descriptor& xmlDescriptor();
};

struct BuildingDescription : public xmlserdes::Serializable<BuildingDescription>
{
    std::string name;
    std::vector<Room> rooms;

    static const char* xmlDefaultTag() { return "building-description"; }
    static const xmlserdes::Descriptor& xmlDescriptor();
};

void printSummary(const BuildingDescription& building);
