/**
 * @file commands.hh
 * @brief Whole-file message operations used by the command line tool
 * @author Igor
 * @date 19/10/2026
 *
 * Each operation parses the input file, applies one lookup or mutation and,
 * where the file changes, serializes the result. Failures surface as the
 * library's exceptions; no partial output is produced.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Append a message chunk to a PNG file
     * @param input PNG file bytes
     * @param type_text Type of the new chunk, e.g. "RuSt"
     * @param message Message text stored as the chunk data
     * @param options Parse options for the input
     * @return The new file bytes
     * @throws parse_error for an invalid input file or chunk type
     */
    PNGME_EXPORT std::vector<std::byte> encode(const std::vector<std::byte>& input,
                                               std::string_view type_text,
                                               std::string_view message,
                                               const parse_options& options = parse_options{});

    /**
     * @brief Read the message of the first chunk of a type
     * @throws not_found_error if the file has no chunk of that type
     */
    PNGME_EXPORT std::string decode(const std::vector<std::byte>& input,
                                    std::string_view type_text,
                                    const parse_options& options = parse_options{});

    /**
     * @brief Remove the first chunk of a type
     * @return The new file bytes
     * @throws not_found_error if the file has no chunk of that type
     */
    PNGME_EXPORT std::vector<std::byte> remove_message(const std::vector<std::byte>& input,
                                                       std::string_view type_text,
                                                       const parse_options& options = parse_options{});

    /**
     * @brief Human-readable listing of the file's chunks
     */
    PNGME_EXPORT std::string describe(const std::vector<std::byte>& input,
                                      const parse_options& options = parse_options{});

} // namespace pngme
