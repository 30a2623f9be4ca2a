
#include "Buffer.hpp"

#include <cctype>
#include <cstring>

namespace {

const char* _base64Chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64Value(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

}

namespace xmlserdes {

std::string encodeBase64(const void* data, size_t size)
{
    const unsigned char* bytes = (const unsigned char*)data;
    std::string result;
    result.reserve((size + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < size; i += 3)
    {
        unsigned int block = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        result.push_back(_base64Chars[(block >> 18) & 0x3f]);
        result.push_back(_base64Chars[(block >> 12) & 0x3f]);
        result.push_back(_base64Chars[(block >> 6) & 0x3f]);
        result.push_back(_base64Chars[block & 0x3f]);
    }
    if (i < size)
    {
        unsigned int block = bytes[i] << 16;
        if (i + 1 < size)
            block |= bytes[i + 1] << 8;
        result.push_back(_base64Chars[(block >> 18) & 0x3f]);
        result.push_back(_base64Chars[(block >> 12) & 0x3f]);
        result.push_back(i + 1 < size ? _base64Chars[(block >> 6) & 0x3f] : '=');
        result.push_back('=');
    }
    return result;
}

bool decodeBase64(const std::string& text, std::vector<char>& data)
{
    std::string str;
    str.reserve(text.size());
    for (std::string::const_iterator i = text.begin(), end = text.end(); i != end; ++i)
        if (!isspace((unsigned char)*i))
            str.push_back(*i);
    if (str.size() % 4 != 0)
        return false;

    data.clear();
    data.reserve(str.size() / 4 * 3);
    for (size_t i = 0; i < str.size(); i += 4)
    {
        int values[4];
        size_t padding = 0;
        for (size_t j = 0; j < 4; ++j)
        {
            char c = str[i + j];
            if (c == '=')
            {
                if (i + 4 != str.size() || j < 2)
                    return false;
                ++padding;
                values[j] = 0;
                continue;
            }
            if (padding)
                return false;
            values[j] = base64Value(c);
            if (values[j] < 0)
                return false;
        }
        unsigned int block = (values[0] << 18) | (values[1] << 12) | (values[2] << 6) | values[3];
        data.push_back((char)((block >> 16) & 0xff));
        if (padding < 2)
            data.push_back((char)((block >> 8) & 0xff));
        if (padding < 1)
            data.push_back((char)(block & 0xff));
    }
    return true;
}

bool getListItem(const char*& s, std::string& result)
{
    while (isspace((unsigned char)*s))
        ++s;
    if (!*s)
        return false;
    const char* end = strchr(s, ',');
    const char* itemEnd = end ? end : s + strlen(s);
    while (itemEnd > s && isspace((unsigned char)itemEnd[-1]))
        --itemEnd;
    result = std::string(s, itemEnd - s);
    s = end ? end + 1 : itemEnd + strlen(itemEnd);
    return true;
}

std::vector<std::string> splitList(const std::string& text)
{
    std::vector<std::string> result;
    const char* s = text.c_str();
    std::string item;
    while (getListItem(s, item))
        result.push_back(item);
    size_t last = text.find_last_not_of(" \t\n\r\v\f");
    if (last != std::string::npos && text[last] == ',')
        result.push_back(std::string());
    return result;
}

}
