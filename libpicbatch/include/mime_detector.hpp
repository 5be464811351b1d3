#ifndef PICBATCH_MIME_DETECTOR_HPP
#define PICBATCH_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>

namespace picbatch {

    /**
     * @brief Content based MIME type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         *
         * @param data File contents (a prefix is enough).
         * @return A string representing the MIME type (e.g., "image/jpeg"),
         * or an empty string when libmagic is unavailable or gives up.
         */
        static std::string detect(std::span<const uint8_t> data);
    };

} // namespace picbatch
#endif //PICBATCH_MIME_DETECTOR_HPP
