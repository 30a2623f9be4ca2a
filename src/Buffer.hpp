
#pragma once

#include <string>
#include <vector>

namespace xmlserdes {

std::string encodeBase64(const void* data, size_t size);
bool decodeBase64(const std::string& text, std::vector<char>& data);

bool getListItem(const char*& s, std::string& result);

// a trailing separator yields an empty last item
std::vector<std::string> splitList(const std::string& text);

inline bool checkStride(size_t size, size_t stride) { return stride != 0 && size % stride == 0; }

}
