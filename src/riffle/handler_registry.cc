//
// Handler registry implementation
//

#include <riffle/handler_registry.hh>
#include <vector>

namespace riffle {

    void handler_registry::on_chunk_in_form(std::string form_type, std::string chunk_id, chunk_handler handler) {
        form_handlers_.emplace(std::make_pair(std::move(form_type), std::move(chunk_id)), std::move(handler));
    }

    void handler_registry::on_chunk(std::string chunk_id, chunk_handler handler) {
        global_handlers_.emplace(std::move(chunk_id), std::move(handler));
    }

    void handler_registry::emit(const chunk_event& event) const {
        // Collect all matching handlers with proper precedence
        std::vector<const chunk_handler*> handlers_to_call;

        auto form_range = form_handlers_.equal_range({event.container.form_type, event.data.identifier});
        for (auto it = form_range.first; it != form_range.second; ++it) {
            handlers_to_call.push_back(&it->second);
        }

        auto range = global_handlers_.equal_range(event.data.identifier);
        for (auto it = range.first; it != range.second; ++it) {
            handlers_to_call.push_back(&it->second);
        }

        for (const auto* handler : handlers_to_call) {
            (*handler)(event);
        }
    }

} // namespace riffle
