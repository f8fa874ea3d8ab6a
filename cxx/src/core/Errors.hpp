/**
 * @file Errors.hpp
 * @brief Exception types raised by the synthesis core.
 */

#ifndef SOUNDWAVE_ERRORS_HPP
#define SOUNDWAVE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace soundwave {

/**
 * @brief A pitch letter outside A-G.
 */
class InvalidKeyError : public std::invalid_argument {
public:
    explicit InvalidKeyError(char key)
        : std::invalid_argument(std::string("Invalid white key: '") + key + "'")
        , key_(key)
    {}

    InvalidKeyError(char key, size_t line)
        : std::invalid_argument(std::string("Invalid white key: '") + key + "' on line " + std::to_string(line))
        , key_(key)
    {}

    char key() const { return key_; }

private:
    char key_;
};

/**
 * @brief Sounds with different sample rates cannot be concatenated.
 */
class SampleRateMismatchError : public std::invalid_argument {
public:
    SampleRateMismatchError(double expected, double actual)
        : std::invalid_argument("Sample rate mismatch: expected " + std::to_string(expected) +
                                " Hz, got " + std::to_string(actual) + " Hz")
        , expected_(expected)
        , actual_(actual)
    {}

    double expected() const { return expected_; }
    double actual() const { return actual_; }

private:
    double expected_;
    double actual_;
};

/**
 * @brief Concatenation of zero sounds (or a score with no valid records).
 */
class EmptyCompositionError : public std::invalid_argument {
public:
    explicit EmptyCompositionError(const std::string& what)
        : std::invalid_argument(what)
    {}
};

/**
 * @brief A score file that cannot be opened for reading.
 */
class ScoreFileError : public std::runtime_error {
public:
    explicit ScoreFileError(const std::string& path)
        : std::runtime_error("Cannot open score file: " + path)
        , path_(path)
    {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace soundwave

#endif // SOUNDWAVE_ERRORS_HPP
