#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <stdexcept>
#include <string>


namespace ssd_augmentation
{

// Base class for all errors raised by the augmentation library
class AugmentationException : public std::runtime_error
{
public:
  explicit AugmentationException(const std::string & message)
  : std::runtime_error(message) {}
};

// Invalid static configuration, e.g. inverted bounds or mismatched weight counts
class ConfigError : public AugmentationException
{
public:
  explicit ConfigError(const std::string & message)
  : AugmentationException("ConfigError: " + message) {}
};

// An operation received an image or label set it cannot handle
class TypeMismatch : public AugmentationException
{
public:
  explicit TypeMismatch(const std::string & message)
  : AugmentationException("TypeMismatch: " + message) {}
};

} // namespace ssd_augmentation
