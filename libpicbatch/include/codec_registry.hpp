/**
 * @file codec_registry.hpp
 * @brief Defines the registry for discovering IImageCodec instances.
 */

#ifndef PICBATCH_CODEC_REGISTRY_HPP
#define PICBATCH_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace picbatch {

/**
 * @brief Registry of all available image codecs in picbatch.
 *
 * @details The CodecRegistry owns the JPEG, PNG and WebP codecs and
 * answers lookups by MIME type, format or raw content.
 * Returned pointers are non-owning and live as long as the registry.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register all built-in codecs.
     */
    CodecRegistry();

    /**
     * @brief Find the codec that supports a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointer, or nullptr when no codec handles it.
     */
    [[nodiscard]] IImageCodec* find_by_mime(const std::string& mime) const;

    /// @return The codec writing @p format, or nullptr for ImageFormat::Unknown.
    [[nodiscard]] IImageCodec* find_by_format(ImageFormat format) const;

    /**
     * @brief Picks the codec for a file's contents.
     *
     * Asks libmagic first and falls back to the codecs' own signature
     * checks when libmagic is unavailable or reports a type no codec
     * handles.
     *
     * @return Non-owning pointer, or nullptr when the data is not a
     * supported image.
     */
    [[nodiscard]] IImageCodec* find_for_content(std::span<const uint8_t> data) const;

    /**
     * @brief Access all registered codecs.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

private:
    ///< Owned instances of all registered codecs.
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace picbatch

#endif // PICBATCH_CODEC_REGISTRY_HPP
