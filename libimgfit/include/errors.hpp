/**
 * @file errors.hpp
 * @brief Exception types surfaced by the optimization pipeline.
 */

#ifndef IMGFIT_ERRORS_HPP
#define IMGFIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace imgfit {

/**
 * @brief Base class of every error raised by imgfit.
 *
 * Callers that only need to know "the image could not be processed"
 * can catch this; the subclasses identify which stage failed.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The input bytes could not be interpreted as any supported raster format.
 */
class DecodeError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief A render surface (Canvas) of the requested size could not be created.
 */
class ContextUnavailableError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief The output encoder failed or produced no data.
 */
class EncodeError final : public Error {
public:
    using Error::Error;
};

/**
 * @brief A data URI or its base64 payload is malformed.
 */
class DataUriError final : public Error {
public:
    using Error::Error;
};

} // namespace imgfit

#endif // IMGFIT_ERRORS_HPP
