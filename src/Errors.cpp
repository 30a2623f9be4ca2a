
#include "Errors.hpp"

#include <sstream>

namespace {

std::string formatMessage(const std::string& message, const xmlserdes::Path& path)
{
    if (path.empty())
        return message;
    return message + " at " + xmlserdes::toString(path);
}

std::string formatSyntaxError(const std::string& message, int line)
{
    if (line <= 0)
        return message;
    std::stringstream s;
    s << "Syntax error at line '" << line << "': " << message;
    return s.str();
}

std::string formatShape(size_t size, size_t stride)
{
    std::stringstream s;
    s << "Data size " << size << " is not a multiple of element size " << stride;
    return s.str();
}

std::string truncate(const std::string& text)
{
    if (text.size() <= 100)
        return text;
    return text.substr(0, 100) + "...";
}

}

namespace xmlserdes {

std::string toString(const Path& path)
{
    std::string result;
    for (Path::const_iterator i = path.begin(), end = path.end(); i != end; ++i)
    {
        result.push_back('/');
        result.append(*i);
    }
    if (result.empty())
        result = "/";
    return result;
}

std::string compareTags(const std::vector<std::string>& missing, const std::vector<std::string>& unexpected)
{
    std::string result = "[";
    for (std::vector<std::string>::const_iterator i = missing.begin(), end = missing.end(); i != end; ++i)
    {
        if (result.size() > 1)
            result.append(", ");
        result.append("missing: " + *i);
    }
    for (std::vector<std::string>::const_iterator i = unexpected.begin(), end = unexpected.end(); i != end; ++i)
    {
        if (result.size() > 1)
            result.append(", ");
        result.append("unexpected: " + *i);
    }
    result.push_back(']');
    return result;
}

Error::Error(const std::string& message, const Path& path)
    : std::runtime_error(formatMessage(message, path))
    , _message(message)
    , _path(path)
{
}

XmlError::XmlError(const std::string& message, int line)
    : Error(formatSyntaxError(message, line), Path())
    , _line(line)
{
}

MissingAttributeError::MissingAttributeError(const std::string& name, const Path& path)
    : Error("Missing attribute '" + name + "'", path)
    , _name(name)
{
}

MissingElementError::MissingElementError(const std::string& name, const Path& path)
    : Error("Missing element '" + name + "'", path)
    , _name(name)
{
}

MissingElementError::MissingElementError(const std::string& name, const std::string& message, const Path& path)
    : Error(message, path)
    , _name(name)
{
}

UnexpectedAttributeError::UnexpectedAttributeError(const std::string& name, const Path& path)
    : Error("Unexpected attribute '" + name + "'", path)
    , _name(name)
{
}

ParseError::ParseError(const std::string& text, const std::string& typeName, const Path& path)
    : Error("Could not parse '" + truncate(text) + "' as " + typeName, path)
    , _text(text)
{
}

ShapeError::ShapeError(size_t size, size_t stride, const Path& path)
    : Error(formatShape(size, stride), path)
{
}

}
