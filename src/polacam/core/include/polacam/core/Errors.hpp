#pragma once

#include <stdexcept>
#include <string>

namespace polacam {

/// Base class of every failure raised by polacam itself.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Input bytes are not a valid or recognized image.
class DecodeFailure : public Error {
public:
    explicit DecodeFailure(const std::string& what) : Error(what) {}
};

/// A finished canvas could not be serialized.
class EncodeFailure : public Error {
public:
    explicit EncodeFailure(const std::string& what) : Error(what) {}
};

} // namespace polacam
