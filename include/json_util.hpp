#ifndef JSON_UTIL_HPP
#define JSON_UTIL_HPP

#include <optional>
#include <string>

std::string jsonQuote(const std::string& value);

// Quoted string, or null when absent.
std::string jsonOptional(const std::optional<std::string>& value);

#endif
