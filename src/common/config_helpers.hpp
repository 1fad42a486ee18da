#pragma once

#include <initializer_list>
#include <string>

namespace scout::config {

// Each reader returns the first path that resolves to a usable value.
int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue);
double ReadDoubleConfig(std::initializer_list<const char*> paths, double defaultValue);
std::string ReadStringConfig(const char *path, const std::string &defaultValue);

} // namespace scout::config
