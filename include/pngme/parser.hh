/**
 * @file parser.hh
 * @brief Callback-style chunk traversal utilities
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <vector>
#include <pngme/chunk_iterator.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @brief Simple functional interface for iterating chunks with custom options
     *
     * Calls the provided function for each chunk in the buffer, in file order.
     *
     * @tparam Func Callable type accepting const chunk_iterator::chunk_info&
     * @param bytes PNG file contents
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func, const parse_options& options) {
        chunk_iterator it(bytes, options);

        while (it.has_next()) {
            func(static_cast<const chunk_iterator::chunk_info&>(it.current()));
            it.next();
        }
    }

    /**
     * @brief Simple functional interface for iterating chunks
     *
     * Uses default parse options.
     */
    template<typename Func>
    void for_each_chunk(const std::vector<std::byte>& bytes, Func func) {
        for_each_chunk(bytes, func, parse_options{});
    }

} // namespace pngme
