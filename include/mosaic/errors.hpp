/**
 * @file errors.hpp
 * @brief Exception types raised by the beam modelling pipeline
 */

#ifndef MOSAIC_ERRORS_HPP
#define MOSAIC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mosaic {

/**
 * @brief Base class of every error raised by mosaic itself
 */
class MosaicError : public std::runtime_error {
public:
    explicit MosaicError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Array geometry has fewer than 3 antennas, PSF is undefined
 */
class InsufficientAntennasError : public MosaicError {
public:
    explicit InsufficientAntennasError(const std::string& what) : MosaicError(what) {}
};

/**
 * @brief Overlap fraction outside the open interval (0, 1)
 */
class InvalidOverlapError : public MosaicError {
public:
    explicit InvalidOverlapError(const std::string& what) : MosaicError(what) {}
};

/**
 * @brief Fraction calculation requested on a non-counter overlap result
 */
class UnsupportedModeError : public MosaicError {
public:
    explicit UnsupportedModeError(const std::string& what) : MosaicError(what) {}
};

/**
 * @brief Coordinate, target or time argument in no recognized form
 */
class InvalidInputTypeError : public MosaicError {
public:
    explicit InvalidInputTypeError(const std::string& what) : MosaicError(what) {}
};

} // namespace mosaic

#endif // MOSAIC_ERRORS_HPP
