// common/utils/string_utils.h
#ifndef PLANFLOW_COMMON_UTILS_STRING_UTILS_H
#define PLANFLOW_COMMON_UTILS_STRING_UTILS_H

#include <string>
#include <string_view>

namespace planflow {

std::string to_lower(std::string_view s);
std::string trim(std::string_view s);

// Case-insensitive substring test; an empty needle is always found.
bool contains_ci(std::string_view haystack, std::string_view needle);

} // namespace planflow

#endif // PLANFLOW_COMMON_UTILS_STRING_UTILS_H
