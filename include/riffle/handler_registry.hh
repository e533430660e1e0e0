/**
 * @file handler_registry.hh
 * @brief Event handler registry for chunk processing
 */

#pragma once

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <riffle/export_riffle.h>
#include <riffle/chunk.hh>
#include <riffle/header_classifier.hh>

namespace riffle {

    /**
     * @struct chunk_event
     * @brief Event data passed to chunk handlers
     */
    struct chunk_event {
        const chunk& data;                      ///< The chunk, payload included
        const container_metadata& container;    ///< Header of the enclosing container

        // Delete default constructor - must provide chunk and container
        chunk_event() = delete;

        chunk_event(const chunk& c, const container_metadata& md)
            : data(c), container(md) {}
    };

    /**
     * @typedef chunk_handler
     * @brief Function type for chunk event handlers
     */
    using chunk_handler = std::function<void(const chunk_event& event)>;

    /**
     * @class handler_registry
     * @brief Registry for chunk event handlers with precedence rules
     *
     * Supports two levels of handler specificity:
     * 1. Form-specific handlers (e.g. "fmt " inside "WAVE"), called first
     * 2. Global handlers, called after
     *
     * Multiple handlers can be registered for the same chunk identifier.
     * Identifiers are compared as decoded text, so W64 handlers are keyed
     * by GUID string.
     */
    class RIFFLE_EXPORT handler_registry {
    public:
        /**
         * @brief Register handler for chunks within a specific form type
         * @param form_type Form type to match ("WAVE", "AIFF", ...)
         * @param chunk_id Chunk identifier to handle
         * @param handler Handler function to call
         */
        void on_chunk_in_form(std::string form_type, std::string chunk_id, chunk_handler handler);

        /**
         * @brief Register global handler for a chunk identifier
         * @param chunk_id Chunk identifier to handle
         * @param handler Handler function to call
         */
        void on_chunk(std::string chunk_id, chunk_handler handler);

        /**
         * @brief Emit an event to all matching handlers
         * @param event Event to emit
         */
        void emit(const chunk_event& event) const;

        [[nodiscard]] bool empty() const {
            return form_handlers_.empty() && global_handlers_.empty();
        }

    private:
        std::multimap<std::pair<std::string, std::string>, chunk_handler> form_handlers_;
        std::unordered_multimap<std::string, chunk_handler> global_handlers_;
    };

} // namespace riffle
