
#include "Building.hpp"

#include <nstd/Console.hpp>

const xmlserdes::Descriptor& Furniture::xmlDescriptor()
{
    static const xmlserdes::Descriptor descriptor = xmlserdes::Descriptor::create<Furniture>({
        {"@type", &Furniture::type},
        {"material", &Furniture::material},
        {"count", &Furniture::count},
    });
    return descriptor;
}

const xmlserdes::Descriptor& Room::xmlDescriptor()
{
    static const xmlserdes::Descriptor descriptor = xmlserdes::Descriptor::create<Room>({
        {"dimensions", &Room::dimensions, xmlserdes::numericVector<double>()},
        {"wall-colour", "wall_colour", &Room::wallColour},
        {"contents", &Room::contents},
    });
    return descriptor;
}

const xmlserdes::Descriptor& BuildingDescription::xmlDescriptor()
{
    static const xmlserdes::Descriptor descriptor = xmlserdes::Descriptor::create<BuildingDescription>({
        {"name", &BuildingDescription::name},
        {"rooms", &BuildingDescription::rooms},
    });
    return descriptor;
}

void printSummary(const BuildingDescription& building)
{
    Console::printf("%s: %d room(s)\n", building.name.c_str(), (int)building.rooms.size());
    for (size_t i = 0; i < building.rooms.size(); ++i)
    {
        const Room& room = building.rooms[i];
        double volume = room.dimensions.empty() ? 0. : 1.;
        for (std::vector<double>::const_iterator j = room.dimensions.begin(), end = room.dimensions.end(); j != end; ++j)
            volume *= *j;
        Console::printf("  room %d: %s walls, volume %g\n", (int)(i + 1), room.wallColour.c_str(), volume);
        for (std::vector<Furniture>::const_iterator j = room.contents.begin(), end = room.contents.end(); j != end; ++j)
            Console::printf("    %d x %s (%s)\n", (int)j->count, j->type.c_str(), j->material.c_str());
    }
}
