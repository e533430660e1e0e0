//
// Read-only memory-mapped file source
//

#include <limits>

#include <riffle/source.hh>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace riffle {

    mapped_source::mapped_source(const std::filesystem::path& path) {
#if defined(_WIN32)
        HANDLE h = ::CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                                 OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        THROW_IO_IF(h == INVALID_HANDLE_VALUE, "Source unavailable: cannot open file '", path.string(), "'");
        m_file_handle = static_cast<void*>(h);

        LARGE_INTEGER sz;
        if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
            close();
            THROW_IO("Source unavailable: cannot stat file '", path.string(), "'");
        }
        m_length = static_cast<std::uint64_t>(sz.QuadPart);

        if (m_length != 0) {
            HANDLE map = ::CreateFileMappingW(h, nullptr, PAGE_READONLY, 0, 0, nullptr);
            if (!map) {
                close();
                THROW_IO("Source unavailable: cannot map file '", path.string(), "'");
            }
            m_map_handle = static_cast<void*>(map);

            void* p = ::MapViewOfFile(map, FILE_MAP_READ, 0, 0, 0);
            if (!p) {
                close();
                THROW_IO("Source unavailable: cannot map file '", path.string(), "'");
            }
            m_view = p;
        }
#else
        m_fd = ::open(path.c_str(), O_RDONLY);
        THROW_IO_IF(m_fd < 0, "Source unavailable: cannot open file '", path.string(), "'");

        struct stat st {};
        if (::fstat(m_fd, &st) != 0 || st.st_size < 0) {
            close();
            THROW_IO("Source unavailable: cannot stat file '", path.string(), "'");
        }
        m_length = static_cast<std::uint64_t>(st.st_size);

        if (m_length > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
            close();
            THROW_IO("Source unavailable: file '", path.string(), "' is too large to map");
        }

        if (m_length != 0) {
            void* p = ::mmap(nullptr, static_cast<std::size_t>(m_length), PROT_READ, MAP_PRIVATE, m_fd, 0);
            if (p == MAP_FAILED) {
                close();
                THROW_IO("Source unavailable: cannot map file '", path.string(), "'");
            }
            m_view = p;
        }
#endif
        attach(static_cast<const std::byte*>(m_view), m_view ? m_length : 0);
    }

    mapped_source::~mapped_source() {
        close();
    }

    void mapped_source::close() noexcept {
#if defined(_WIN32)
        if (m_view) {
            ::UnmapViewOfFile(m_view);
        }
        if (m_map_handle) {
            ::CloseHandle(static_cast<HANDLE>(m_map_handle));
        }
        if (m_file_handle) {
            ::CloseHandle(static_cast<HANDLE>(m_file_handle));
        }
        m_file_handle = nullptr;
        m_map_handle = nullptr;
#else
        if (m_view && m_length != 0) {
            (void)::munmap(m_view, static_cast<std::size_t>(m_length));
        }
        if (m_fd >= 0) {
            (void)::close(m_fd);
        }
        m_fd = -1;
#endif
        m_view = nullptr;
        m_length = 0;
    }

} // namespace riffle
