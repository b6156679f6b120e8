#ifndef MININN_ERRORS_HPP
#define MININN_ERRORS_HPP
#pragma once

#include <stdexcept>
#include <string>

namespace MiniNN {

    /**
     * @brief Raised for invalid construction arguments: unknown activation or
     * loss names, empty layer lists, zero widths or batch sizes.
     */
    class config_error : public std::invalid_argument {
    public:
        explicit config_error(const std::string& message)
            : std::invalid_argument("Config Error: " + message) {}
    };

    /**
     * @brief Raised when matrix shapes handed to a layer, loss, trainer or
     * preprocessor are incompatible.
     */
    class shape_error : public std::invalid_argument {
    public:
        explicit shape_error(const std::string& message)
            : std::invalid_argument("Shape Error: " + message) {}
    };

    /**
     * @brief Raised for unreadable, unwritable or malformed files.
     */
    class io_error : public std::runtime_error {
    public:
        explicit io_error(const std::string& message)
            : std::runtime_error("IO Error: " + message) {}
    };

};

/**
 * @brief Throws `exception_type(message)` when `condition` holds.
 *
 * Define MININN_DISABLE_ERROR_CHECKS to compile the checks out; shape errors
 * are then left to Eigen's own assertions.
 */
#ifndef MININN_DISABLE_ERROR_CHECKS
  #define MININN_CHECK(condition, exception_type, message) \
    do \
    { \
        if (condition) \
        { \
            throw exception_type(message); \
        } \
    } while (0)
#else
  #define MININN_CHECK(condition, exception_type, message) ((void)0)
#endif

#endif
