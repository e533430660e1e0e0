/**
 * @file parser.hh
 * @brief Convenience entry points built on container_walker
 */

#pragma once

#include <riffle/container_walker.hh>
#include <riffle/handler_registry.hh>
#include <riffle/parse_options.hh>
#include <riffle/source.hh>

namespace riffle {

    /**
     * @brief Walk a container and emit one event per chunk
     *
     * @param src Source holding the container
     * @param handlers Registry of event handlers to process chunks
     * @param options Parse options for controlling parsing behavior
     * @return How the walk ended (clean or truncated)
     */
    inline walk_status parse(source& src, const handler_registry& handlers, const parse_options& options) {
        container_walker walker(src, options);

        while (auto c = walker.next()) {
            chunk_event event(*c, walker.metadata());
            handlers.emit(event);
        }
        return walker.status();
    }

    inline walk_status parse(source& src, const handler_registry& handlers) {
        return parse(src, handlers, parse_options{});
    }

    /**
     * @brief Call func(const chunk&, const container_metadata&) for each chunk
     *
     * @tparam Func Callable type
     * @param src Source holding the container
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     * @return How the walk ended (clean or truncated)
     */
    template<typename Func>
    walk_status for_each_chunk(source& src, Func func, const parse_options& options) {
        container_walker walker(src, options);

        for (const auto& c : walker) {
            func(c, walker.metadata());
        }
        return walker.status();
    }

    template<typename Func>
    walk_status for_each_chunk(source& src, Func func) {
        return for_each_chunk(src, func, parse_options{});
    }

} // namespace riffle
