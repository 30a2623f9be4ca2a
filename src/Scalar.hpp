
#pragma once

#include <cstdint>
#include <string>

namespace xmlserdes {

template <typename T>
struct IsScalar
{
    static const bool value = false;
};

template <> struct IsScalar<int8_t> { static const bool value = true; };
template <> struct IsScalar<uint8_t> { static const bool value = true; };
template <> struct IsScalar<int16_t> { static const bool value = true; };
template <> struct IsScalar<uint16_t> { static const bool value = true; };
template <> struct IsScalar<int32_t> { static const bool value = true; };
template <> struct IsScalar<uint32_t> { static const bool value = true; };
template <> struct IsScalar<int64_t> { static const bool value = true; };
template <> struct IsScalar<uint64_t> { static const bool value = true; };
template <> struct IsScalar<float> { static const bool value = true; };
template <> struct IsScalar<double> { static const bool value = true; };
template <> struct IsScalar<bool> { static const bool value = true; };
template <> struct IsScalar<std::string> { static const bool value = true; };

std::string toText(int8_t value);
std::string toText(uint8_t value);
std::string toText(int16_t value);
std::string toText(uint16_t value);
std::string toText(int32_t value);
std::string toText(uint32_t value);
std::string toText(int64_t value);
std::string toText(uint64_t value);
std::string toText(float value);
std::string toText(double value);
std::string toText(bool value);
std::string toText(const std::string& value);

bool fromText(const std::string& text, int8_t& value);
bool fromText(const std::string& text, uint8_t& value);
bool fromText(const std::string& text, int16_t& value);
bool fromText(const std::string& text, uint16_t& value);
bool fromText(const std::string& text, int32_t& value);
bool fromText(const std::string& text, uint32_t& value);
bool fromText(const std::string& text, int64_t& value);
bool fromText(const std::string& text, uint64_t& value);
bool fromText(const std::string& text, float& value);
bool fromText(const std::string& text, double& value);
bool fromText(const std::string& text, bool& value);
bool fromText(const std::string& text, std::string& value);

const char* getTypeName(const int8_t*);
const char* getTypeName(const uint8_t*);
const char* getTypeName(const int16_t*);
const char* getTypeName(const uint16_t*);
const char* getTypeName(const int32_t*);
const char* getTypeName(const uint32_t*);
const char* getTypeName(const int64_t*);
const char* getTypeName(const uint64_t*);
const char* getTypeName(const float*);
const char* getTypeName(const double*);
const char* getTypeName(const bool*);
const char* getTypeName(const std::string*);

// names is null-terminated, a value maps to the name at its index
bool enumToText(int64_t value, const char* const* names, std::string& text);
bool enumFromText(const std::string& text, const char* const* names, int64_t& value);

std::string trim(const std::string& text);

}
