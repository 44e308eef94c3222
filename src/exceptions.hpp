#ifndef FASTACLEAN_EXCEPTIONS_HPP
#define FASTACLEAN_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

class BadParameter: public std::runtime_error {
public:
    BadParameter(const std::string& what_arg) : std::runtime_error(what_arg) {};
};

/* Only raised when strict input checking is enabled */
class InvalidFasta : public std::runtime_error {
public:
    InvalidFasta(std::string message) : runtime_error(message) { }
};

class InvalidFile : public std::runtime_error {
public:
    InvalidFile(std::string message) : runtime_error(message) { }
};

#endif
