/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG files
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG files
     *
     * Controls structure strictness, size limits, and warning handling.
     * Chunk-level corruption (truncation, CRC mismatch, bad chunk types)
     * is always fatal regardless of these settings.
     */
    struct parse_options {
        /**
         * @brief Strict structure mode
         *
         * When true, a file that does not start with IHDR, has no IEND
         * chunk, or uses a chunk type with the reserved bit set fails with
         * error_code::bad_structure. When false, these conditions are
         * reported through on_warning and the file is accepted unchanged.
         * Chunks following IEND are reported in both modes but never fail.
         */
        bool strict = false;

        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * Chunks declaring a larger length fail with
         * error_code::chunk_too_large before their data is read.
         * Default is the full 32-bit range.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFull;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset where warning occurred
         * @param category Warning category ("reserved_bit", "missing_ihdr",
         *        "missing_iend", "after_iend")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
