#ifndef VOXLINE_CORE_STRING_UTILS_H
#define VOXLINE_CORE_STRING_UTILS_H

#include <string>

namespace voxline {

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

}  // namespace voxline

#endif  // VOXLINE_CORE_STRING_UTILS_H
