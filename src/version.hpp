#ifndef FASTACLEAN_VERSION_HPP
#define FASTACLEAN_VERSION_HPP

#include <string>

std::string version_string();

#endif
