
#include "Scalar.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <locale>
#include <sstream>

namespace {

bool parseSigned(const std::string& text, int64_t min, int64_t max, int64_t& value)
{
    std::string str = xmlserdes::trim(text);
    if (str.empty())
        return false;
    char* end;
    errno = 0;
    long long result = strtoll(str.c_str(), &end, 10);
    if (errno != 0 || *end || result < min || result > max)
        return false;
    value = result;
    return true;
}

bool parseUnsigned(const std::string& text, uint64_t max, uint64_t& value)
{
    std::string str = xmlserdes::trim(text);
    if (str.empty() || str[0] == '-')
        return false;
    char* end;
    errno = 0;
    unsigned long long result = strtoull(str.c_str(), &end, 10);
    if (errno != 0 || *end || result > max)
        return false;
    value = result;
    return true;
}

template <typename T>
std::string formatFloat(T value, int precision)
{
    std::ostringstream s;
    s.imbue(std::locale::classic());
    s.precision(precision);
    s << value;
    return s.str();
}

template <typename T>
bool parseSpecialFloat(const std::string& str, T& value)
{
    size_t begin = str[0] == '-' || str[0] == '+' ? 1 : 0;
    std::string name = str.substr(begin);
    for (std::string::iterator i = name.begin(), end = name.end(); i != end; ++i)
        *i = (char)tolower((unsigned char)*i);
    if (name == "inf" || name == "infinity")
        value = std::numeric_limits<T>::infinity();
    else if (name == "nan")
        value = std::numeric_limits<T>::quiet_NaN();
    else
        return false;
    if (str[0] == '-')
        value = -value;
    return true;
}

template <typename T>
bool parseFloat(const std::string& text, T& value)
{
    std::string str = xmlserdes::trim(text);
    if (str.empty())
        return false;
    if (parseSpecialFloat(str, value))
        return true;
    std::istringstream s(str);
    s.imbue(std::locale::classic());
    T result;
    s >> result;
    if (s.fail() || !s.eof())
        return false;
    value = result;
    return true;
}

template <typename T>
std::string formatSigned(T value)
{
    std::ostringstream s;
    s.imbue(std::locale::classic());
    s << (int64_t)value;
    return s.str();
}

template <typename T>
std::string formatUnsigned(T value)
{
    std::ostringstream s;
    s.imbue(std::locale::classic());
    s << (uint64_t)value;
    return s.str();
}

template <typename T>
bool parseSignedInteger(const std::string& text, T& value)
{
    int64_t result;
    if (!parseSigned(text, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), result))
        return false;
    value = (T)result;
    return true;
}

template <typename T>
bool parseUnsignedInteger(const std::string& text, T& value)
{
    uint64_t result;
    if (!parseUnsigned(text, std::numeric_limits<T>::max(), result))
        return false;
    value = (T)result;
    return true;
}

template <typename T>
std::string floatToText(T value)
{
    std::string result = formatFloat(value, std::numeric_limits<T>::digits10);
    T check;
    if (!parseFloat(result, check) || check != value)
        result = formatFloat(value, std::numeric_limits<T>::max_digits10);
    if (result.find_first_not_of("-0123456789") == std::string::npos)
        result.append(".0");
    return result;
}

}

namespace xmlserdes {

std::string trim(const std::string& text)
{
    static const char* space = " \t\n\r\v\f";
    size_t begin = text.find_first_not_of(space);
    if (begin == std::string::npos)
        return std::string();
    size_t end = text.find_last_not_of(space);
    return text.substr(begin, end - begin + 1);
}

std::string toText(int8_t value) { return formatSigned(value); }
std::string toText(uint8_t value) { return formatUnsigned(value); }
std::string toText(int16_t value) { return formatSigned(value); }
std::string toText(uint16_t value) { return formatUnsigned(value); }
std::string toText(int32_t value) { return formatSigned(value); }
std::string toText(uint32_t value) { return formatUnsigned(value); }
std::string toText(int64_t value) { return formatSigned(value); }
std::string toText(uint64_t value) { return formatUnsigned(value); }

bool fromText(const std::string& text, int8_t& value) { return parseSignedInteger(text, value); }
bool fromText(const std::string& text, uint8_t& value) { return parseUnsignedInteger(text, value); }
bool fromText(const std::string& text, int16_t& value) { return parseSignedInteger(text, value); }
bool fromText(const std::string& text, uint16_t& value) { return parseUnsignedInteger(text, value); }
bool fromText(const std::string& text, int32_t& value) { return parseSignedInteger(text, value); }
bool fromText(const std::string& text, uint32_t& value) { return parseUnsignedInteger(text, value); }
bool fromText(const std::string& text, int64_t& value) { return parseSignedInteger(text, value); }
bool fromText(const std::string& text, uint64_t& value) { return parseUnsignedInteger(text, value); }

const char* getTypeName(const int8_t*) { return "8-bit integer"; }
const char* getTypeName(const uint8_t*) { return "unsigned 8-bit integer"; }
const char* getTypeName(const int16_t*) { return "16-bit integer"; }
const char* getTypeName(const uint16_t*) { return "unsigned 16-bit integer"; }
const char* getTypeName(const int32_t*) { return "32-bit integer"; }
const char* getTypeName(const uint32_t*) { return "unsigned 32-bit integer"; }
const char* getTypeName(const int64_t*) { return "64-bit integer"; }
const char* getTypeName(const uint64_t*) { return "unsigned 64-bit integer"; }

std::string toText(float value) { return floatToText(value); }
bool fromText(const std::string& text, float& value) { return parseFloat(text, value); }
const char* getTypeName(const float*) { return "single precision floating point"; }

std::string toText(double value) { return floatToText(value); }
bool fromText(const std::string& text, double& value) { return parseFloat(text, value); }
const char* getTypeName(const double*) { return "double precision floating point"; }

std::string toText(bool value) { return value ? "true" : "false"; }
const char* getTypeName(const bool*) { return "boolean"; }

bool fromText(const std::string& text, bool& value)
{
    std::string str = trim(text);
    if (str == "true")
        value = true;
    else if (str == "false")
        value = false;
    else
        return false;
    return true;
}

std::string toText(const std::string& value) { return value; }
bool fromText(const std::string& text, std::string& value) { value = text; return true; }
const char* getTypeName(const std::string*) { return "string"; }

bool enumToText(int64_t value, const char* const* names, std::string& text)
{
    if (value < 0)
        return false;
    for (const char* const* i = names; *i; ++i)
        if (i - names == value)
        {
            text = *i;
            return true;
        }
    return false;
}

bool enumFromText(const std::string& text, const char* const* names, int64_t& value)
{
    std::string str = trim(text);
    for (const char* const* i = names; *i; ++i)
        if (str == *i)
        {
            value = (int64_t)(i - names);
            return true;
        }
    return false;
}

}
