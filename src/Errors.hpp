
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace xmlserdes {

typedef std::vector<std::string> Path;

std::string toString(const Path& path);

// formats as "[missing: a, unexpected: b]"
std::string compareTags(const std::vector<std::string>& missing, const std::vector<std::string>& unexpected);

class Error : public std::runtime_error
{
public:
    Error(const std::string& message, const Path& path);

    const std::string& getMessage() const { return _message; }
    const Path& getPath() const { return _path; }

private:
    std::string _message;
    Path _path;
};

class ConfigurationError : public Error
{
public:
    explicit ConfigurationError(const std::string& message)
        : Error(message, Path())
    {
    }
};

class XmlError : public Error
{
public:
    XmlError(const std::string& message, int line);

    int getLine() const { return _line; }

private:
    int _line;
};

class MissingAttributeError : public Error
{
public:
    MissingAttributeError(const std::string& name, const Path& path);

    const std::string& getName() const { return _name; }

private:
    std::string _name;
};

class MissingElementError : public Error
{
public:
    MissingElementError(const std::string& name, const Path& path);
    MissingElementError(const std::string& name, const std::string& message, const Path& path);

    const std::string& getName() const { return _name; }

private:
    std::string _name;
};

class UnexpectedAttributeError : public Error
{
public:
    UnexpectedAttributeError(const std::string& name, const Path& path);

    const std::string& getName() const { return _name; }

private:
    std::string _name;
};

class UnexpectedElementError : public Error
{
public:
    UnexpectedElementError(const std::string& message, const std::string& name, const Path& path)
        : Error(message, path)
        , _name(name)
    {
    }

    const std::string& getName() const { return _name; }

private:
    std::string _name;
};

class ParseError : public Error
{
public:
    ParseError(const std::string& text, const std::string& typeName, const Path& path);

    const std::string& getText() const { return _text; }

private:
    std::string _text;
};

class ShapeError : public Error
{
public:
    ShapeError(size_t size, size_t stride, const Path& path);
};

class ValueError : public Error
{
public:
    ValueError(const std::string& message, const Path& path)
        : Error(message, path)
    {
    }
};

}
