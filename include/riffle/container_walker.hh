/**
 * @file container_walker.hh
 * @brief Sequential traversal of the chunks of a container
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

#include <riffle/export_riffle.h>
#include <riffle/chunk.hh>
#include <riffle/format_descriptor.hh>
#include <riffle/header_classifier.hh>
#include <riffle/parse_options.hh>
#include <riffle/source.hh>

namespace riffle {

    /**
     * @enum walk_status
     * @brief Where a walk stands
     */
    enum class walk_status {
        scanning,   ///< More chunks may follow
        clean,      ///< Reached the declared end of the container
        truncated,  ///< Stopped early: the source ran out before the declared end
        failed      ///< A fatal error was thrown to the caller
    };

    /**
     * @struct walk_result
     * @brief Everything an eager walk produces
     */
    struct walk_result {
        container_metadata metadata;
        format_descriptor format;
        std::vector<chunk> chunks;     ///< In source order
        walk_status status = walk_status::scanning;

        [[nodiscard]] bool truncated() const { return status == walk_status::truncated; }
    };

    /**
     * @class container_walker
     * @brief Drives read_chunk from the first chunk to the declared end
     *
     * The header is classified on construction. Chunks are then pulled one
     * at a time with next(), iterated with begin()/end(), or drained with
     * collect(); all three share one code path. A walk is one-shot: it moves
     * the source cursor, and a fresh walk needs a new walker.
     *
     * An end_of_source_error from the chunk reader ends the walk with
     * walk_status::truncated instead of propagating. Every other error
     * propagates and leaves the walker in walk_status::failed.
     *
     * Only one walker may drive a given source at a time.
     */
    class RIFFLE_EXPORT container_walker {
    public:
        /**
         * @brief Classify the header and position at the first chunk
         * @param src Source holding the container (must outlive the walker)
         * @param options Parse options, copied
         * @param start Offset of the header for embedded containers
         */
        explicit container_walker(source& src, const parse_options& options = parse_options{},
                                  std::uint64_t start = 0);

        [[nodiscard]] const container_metadata& metadata() const { return m_info.metadata; }
        [[nodiscard]] const format_descriptor& format() const { return m_info.format; }
        [[nodiscard]] walk_status status() const { return m_status; }

        [[nodiscard]] bool done() const { return m_status != walk_status::scanning; }
        [[nodiscard]] bool truncated() const { return m_status == walk_status::truncated; }

        /**
         * @brief Produce the next chunk
         * @return The chunk, or nullopt once the walk is over
         */
        std::optional<chunk> next();

        /**
         * @brief Drain the remaining chunks
         * @return Metadata, descriptor, the chunks not yet produced, and the final status
         */
        walk_result collect();

        /**
         * @class iterator
         * @brief Single-pass input iterator over next()
         */
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = chunk;
            using difference_type = std::ptrdiff_t;
            using pointer = const chunk*;
            using reference = const chunk&;

            iterator() = default;

            reference operator*() const { return *m_current; }
            pointer operator->() const { return &*m_current; }

            iterator& operator++() {
                m_current = m_walker->next();
                return *this;
            }

            bool operator==(const iterator& o) const {
                return m_current.has_value() == o.m_current.has_value();
            }
            bool operator!=(const iterator& o) const { return !(*this == o); }

        private:
            friend class container_walker;
            explicit iterator(container_walker* walker)
                : m_walker(walker), m_current(walker->next()) {}

            container_walker* m_walker = nullptr;
            std::optional<chunk> m_current;
        };

        iterator begin() { return iterator(this); }
        iterator end() { return iterator(); }

    private:
        source& m_source;
        parse_options m_options;
        container_info m_info;
        extended_size_cursor m_extended_sizes;
        std::uint64_t m_next_offset;
        walk_status m_status = walk_status::scanning;
    };

    /**
     * @brief Classify and walk a whole container in one call
     * @param src Source holding the container
     * @param options Parse options
     * @param start Offset of the header for embedded containers
     */
    RIFFLE_EXPORT walk_result read_container(source& src, const parse_options& options = parse_options{},
                                             std::uint64_t start = 0);

} // namespace riffle
