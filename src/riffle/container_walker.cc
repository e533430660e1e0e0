//
// Container walker: sequential chunk traversal with EOS handling
//

#include <riffle/container_walker.hh>
#include <riffle/chunk_reader.hh>
#include <riffle/exceptions.hh>

namespace riffle {

    container_walker::container_walker(source& src, const parse_options& options, std::uint64_t start)
        : m_source(src)
        , m_options(options)
        , m_info(classify_header(src, start, m_options))
        , m_next_offset(m_info.metadata.data_offset) {
    }

    std::optional<chunk> container_walker::next() {
        if (done()) {
            return std::nullopt;
        }

        // The declared size bounds the scan, not the source length
        if (m_next_offset >= m_info.metadata.declared_end) {
            m_status = walk_status::clean;
            return std::nullopt;
        }

        try {
            m_source.seek(static_cast<std::int64_t>(m_next_offset), source::set);
            chunk result = read_chunk(m_source, m_info.format, m_options, m_extended_sizes);
            m_next_offset = result.end_offset;
            return result;
        } catch (const end_of_source_error& e) {
            // A truncated length cannot be trusted to resume alignment
            m_status = walk_status::truncated;
            m_options.warn(m_next_offset, "truncated", e.what());
            return std::nullopt;
        } catch (const riffle_error&) {
            m_status = walk_status::failed;
            throw;
        }
    }

    walk_result container_walker::collect() {
        walk_result result;
        result.metadata = m_info.metadata;
        result.format = m_info.format;

        while (auto c = next()) {
            result.chunks.push_back(std::move(*c));
        }

        result.status = m_status;
        return result;
    }

    walk_result read_container(source& src, const parse_options& options, std::uint64_t start) {
        container_walker walker(src, options, start);
        return walker.collect();
    }

} // namespace riffle
