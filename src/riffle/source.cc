//
// Source backends: memory block, stream and file
//

#include <algorithm>
#include <fstream>
#include <istream>
#include <limits>

#include <riffle/source.hh>

namespace riffle {

    // source implementation
    std::size_t source::read_at(std::uint64_t offset, void* dst, std::size_t size) {
        std::uint64_t saved = tell();
        seek(static_cast<std::int64_t>(offset), set);
        std::size_t actual = read(dst, size);
        seek(static_cast<std::int64_t>(saved), set);
        return actual;
    }

    std::vector<std::byte> source::read_bytes(std::size_t size) {
        std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining())));
        std::size_t actual = read(buffer.data(), buffer.size());
        buffer.resize(actual);
        return buffer;
    }

    std::vector<std::byte> source::read_bytes_at(std::uint64_t offset, std::size_t size) {
        std::uint64_t available = offset < this->size() ? this->size() - offset : 0;
        std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(size, available)));
        std::size_t actual = read_at(offset, buffer.data(), buffer.size());
        buffer.resize(actual);
        return buffer;
    }

    std::vector<std::byte> source::read_exact(std::size_t size) {
        std::uint64_t start = tell();
        THROW_EOS_IF(size > remaining(), "Unexpected end of source at offset ", start,
                     ": requested ", size, " bytes, ", remaining(), " remaining");
        std::vector<std::byte> buffer(size);
        std::size_t actual = read(buffer.data(), size);
        THROW_EOS_IF(actual != size, "Unexpected end of source at offset ", start,
                     ": requested ", size, " bytes, got ", actual);
        return buffer;
    }

    fourcc source::read_fourcc() {
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        THROW_EOS_IF(actual != 4, "Failed to read FourCC at offset ", tell() - actual);
        return fourcc(data[0], data[1], data[2], data[3]);
    }

    std::uint64_t source::resolve_seek(std::uint64_t current, std::uint64_t length,
                                       std::int64_t offset, whence_t whence) {
        std::uint64_t base;
        switch (whence) {
            case set:
                base = 0;
                break;
            case cur:
                base = current;
                break;
            case end:
                base = length;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        if (offset < 0) {
            // -(offset + 1) + 1 avoids overflow on INT64_MIN
            std::uint64_t back = static_cast<std::uint64_t>(-(offset + 1)) + 1;
            return back > base ? 0 : base - back;
        }

        std::uint64_t forward = static_cast<std::uint64_t>(offset);
        if (forward > std::numeric_limits<std::uint64_t>::max() - base) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        return base + forward;
    }

    // buffer_source implementation
    void buffer_source::attach(const std::byte* data, std::uint64_t size) {
        m_data = data;
        m_size = size;
        m_position = 0;
    }

    std::size_t buffer_source::read(void* dst, std::size_t size) {
        std::size_t actual = read_at(m_position, dst, size);
        m_position += actual;
        return actual;
    }

    void buffer_source::seek(std::int64_t offset, whence_t whence) {
        m_position = resolve_seek(m_position, m_size, offset, whence);
    }

    std::size_t buffer_source::read_at(std::uint64_t offset, void* dst, std::size_t size) {
        if (size == 0 || offset >= m_size) {
            return 0;
        }
        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::size_t to_read = static_cast<std::size_t>(std::min<std::uint64_t>(size, m_size - offset));
        std::memcpy(dst, m_data + offset, to_read);
        return to_read;
    }

    // memory_source implementation
    memory_source::memory_source(std::vector<std::byte> bytes)
        : m_bytes(std::move(bytes)) {
        attach(m_bytes.data(), m_bytes.size());
    }

    memory_source::memory_source(const void* data, std::size_t size)
        : m_bytes(size) {
        if (size > 0) {
            THROW_IO_UNLESS(data, "Null buffer passed to memory_source");
            std::memcpy(m_bytes.data(), data, size);
        }
        attach(m_bytes.data(), m_bytes.size());
    }

    // stream_source implementation
    stream_source::stream_source(std::istream& is)
        : m_stream(&is) {
        probe_length();
    }

    stream_source::stream_source(std::unique_ptr<std::istream> owned)
        : m_owned(std::move(owned))
        , m_stream(m_owned.get()) {
        probe_length();
    }

    stream_source::~stream_source() = default;

    void stream_source::probe_length() {
        m_stream->clear();
        m_stream->seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream->tellg();
        THROW_IO_IF(end_pos == std::streampos(-1), "Stream is not seekable: cannot determine its length");
        m_size = static_cast<std::uint64_t>(end_pos);
        m_stream->seekg(0, std::ios_base::beg);
        m_position = 0;
    }

    std::size_t stream_source::fetch(std::uint64_t offset, void* dst, std::size_t size) {
        if (size == 0 || offset >= m_size) {
            return 0;
        }
        THROW_IO_UNLESS(dst, "Null buffer in read");

        std::size_t to_read = static_cast<std::size_t>(std::min<std::uint64_t>(size, m_size - offset));

        m_stream->clear();
        m_stream->seekg(static_cast<std::streamoff>(offset), std::ios_base::beg);
        THROW_IO_IF(m_stream->fail(), "Cannot seek stream to offset ", offset);

        m_stream->read(static_cast<char*>(dst), static_cast<std::streamsize>(to_read));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream->gcount());

        THROW_IO_IF(m_stream->bad(), "Stream read failed at offset ", offset);
        return bytes_read;
    }

    std::size_t stream_source::read(void* dst, std::size_t size) {
        std::size_t actual = fetch(m_position, dst, size);
        m_position += actual;
        return actual;
    }

    void stream_source::seek(std::int64_t offset, whence_t whence) {
        m_position = resolve_seek(m_position, m_size, offset, whence);
    }

    std::size_t stream_source::read_at(std::uint64_t offset, void* dst, std::size_t size) {
        return fetch(offset, dst, size);
    }

    // file_source implementation
    static std::unique_ptr<std::istream> open_file(const std::filesystem::path& path) {
        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        THROW_IO_UNLESS(file->is_open(), "Source unavailable: cannot open file '", path.string(), "'");
        return file;
    }

    file_source::file_source(const std::filesystem::path& path)
        : stream_source(open_file(path))
        , m_path(path) {
    }

    // normalization
    std::unique_ptr<source> source::open(std::unique_ptr<source> src) {
        THROW_IO_UNLESS(src, "Null source passed to source::open");
        return src;
    }

    std::unique_ptr<source> source::open(std::vector<std::byte> bytes) {
        return std::make_unique<memory_source>(std::move(bytes));
    }

    std::unique_ptr<source> source::open(const void* data, std::size_t size) {
        return std::make_unique<memory_source>(data, size);
    }

    std::unique_ptr<source> source::open(std::istream& stream) {
        return std::make_unique<stream_source>(stream);
    }

    std::unique_ptr<source> source::open(const std::filesystem::path& path, bool prefer_mmap) {
        std::error_code ec;
        bool regular = std::filesystem::is_regular_file(path, ec);
        THROW_IO_UNLESS(regular, "Source unavailable: '", path.string(), "' is not a regular file");

        if (prefer_mmap) {
            return std::make_unique<mapped_source>(path);
        }
        return std::make_unique<file_source>(path);
    }

} // namespace riffle
