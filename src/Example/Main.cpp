#include <nstd/Process.hpp>
#include <nstd/Console.hpp>

#include "Building.hpp"

namespace {

std::string toStdString(const String& str)
{
    return std::string((const char*)str, str.length());
}

}

void usage(const char* argv0)
{
    Console::errorf("building %s, reads and writes XML building descriptions.\n\
\n\
Usage: building [<xml-file>] [-o <output-file>] [-t <root-tag>]\n\
\n\
Options:\n\
\n\
    <xml-file>\n\
        The path to the input building description.\n\
\n\
    -o <output-file>, --output=<output-file>\n\
        Writes the decoded building description back to <output-file>.\n\
\n\
    -t <root-tag>, --tag=<root-tag>\n\
        The expected tag of the root element. The default is\n\
        'building-description'.\n\
\n\
", VERSION);
}

int main(int argc, char* argv[])
{
    String inputFile;
    String outputFile;
    String rootTag = BuildingDescription::xmlDefaultTag();
    {
        Process::Option options[] = {
            {'o', "output", Process::argumentFlag},
            {'t', "tag", Process::argumentFlag},
            {'h', "help", Process::optionFlag},
            {1000, "version", Process::optionFlag},
        };
        Process::Arguments arguments(argc, argv, options);
        int character;
        String argument;
        while (arguments.read(character, argument))
            switch( character)
            {
            case 'o':
                outputFile = argument;
                break;
            case 't':
                rootTag = argument;
                break;
            case ':':
                Console::errorf("Option %s required an argument.\n", (const char*)argument);
                return 1;
            case 1000:
                Console::errorf("building %s\n", VERSION);
                return 0;
            case '\0':
                inputFile = argument;
                break;
            default:
                usage(argv[0]);
                return 1;
            }
    }
    if (inputFile.isEmpty())
    {
        usage(argv[0]);
        return 1;
    }

    std::string error;
    xmlserdes::xml::Element element;
    if (!xmlserdes::xml::load(toStdString(inputFile), element, error))
    {
        Console::errorf("error: %s\n", error.c_str());
        return 1;
    }

    try
    {
        BuildingDescription building = BuildingDescription::fromXml(element, toStdString(rootTag));
        printSummary(building);
        if (!outputFile.isEmpty() && !xmlserdes::xml::save(building.toXml(toStdString(rootTag)), toStdString(outputFile), error))
        {
            Console::errorf("error: Could not write file '%s': %s\n", (const char*)outputFile, error.c_str());
            return 1;
        }
    }
    catch (const xmlserdes::Error& e)
    {
        Console::errorf("error: %s\n", e.what());
        return 1;
    }

    return 0;
}
