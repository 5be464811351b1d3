/**
 * @file errors.hpp
 * @brief Exception types raised by the picbatch pipeline.
 *
 * Metadata errors are recovered inside the library (see exif_codec.hpp);
 * the rest reach the caller of BatchProcessor according to its
 * FailurePolicy.
 */

#ifndef PICBATCH_ERRORS_HPP
#define PICBATCH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace picbatch {

/// The EXIF block is malformed, truncated or not an EXIF block at all.
class MetadataDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// An ExifDocument cannot be serialized into a valid EXIF block.
class MetadataEncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The input bytes are not an image any registered codec can decode.
class ImageDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The encoder library refused the pixel data or the settings.
class ImageEncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// libarchive failed while assembling the output archive.
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A naming template is syntactically invalid.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A naming template references a placeholder that does not exist.
 */
class UnsupportedTokenError : public FormatError {
public:
    explicit UnsupportedTokenError(std::string token)
        : FormatError("Unsupported token '{" + token + "}' in name pattern"),
          token_(std::move(token)) {}

    /// @return The placeholder name without braces.
    [[nodiscard]] const std::string& token() const noexcept { return token_; }

private:
    std::string token_;
};

} // namespace picbatch

#endif // PICBATCH_ERRORS_HPP
