/**
 * @file source.hh
 * @brief Random-access byte sources consumed by the container parser
 *
 * A source is a byte range of fixed length with a cursor. Four backends
 * are provided (stream, memory block, file, memory-mapped file); they
 * behave identically as far as the parser is concerned.
 */

#pragma once

#include <iosfwd>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>

#include <riffle/export_riffle.h>
#include <riffle/byte_order.hh>
#include <riffle/exceptions.hh>
#include <riffle/fourcc.hh>

namespace riffle {

    /**
     * @class source
     * @brief Abstract random-access byte provider
     *
     * Reads never throw at the end of the range, they return fewer bytes.
     * Seeking past the end is allowed; the next read returns 0 bytes.
     * Seeking before the start clamps to offset 0.
     */
    class RIFFLE_EXPORT source {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            virtual ~source() = default;

            source(const source&) = delete;
            source& operator = (const source&) = delete;

            /**
             * @brief Read up to size bytes at the cursor and advance it
             * @return Number of bytes actually read
             */
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            virtual void seek(std::int64_t offset, whence_t whence = set) = 0;
            virtual std::uint64_t tell() const = 0;

            /**
             * @brief Total length of the range, fixed at construction
             */
            virtual std::uint64_t size() const = 0;

            /**
             * @brief Random read that leaves the cursor untouched
             *
             * The default implementation saves the cursor, seeks, reads
             * and restores it. Backends that can address bytes directly
             * override it.
             */
            virtual std::size_t read_at(std::uint64_t offset, void* dst, std::size_t size);

            void reset() { seek(0, set); }

            [[nodiscard]] std::uint64_t remaining() const {
                auto pos = tell();
                auto len = size();
                return pos < len ? len - pos : 0;
            }

            // Convenience methods
            std::vector<std::byte> read_bytes(std::size_t size);
            std::vector<std::byte> read_bytes_at(std::uint64_t offset, std::size_t size);

            // Throws end_of_source_error on a short read
            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_EOS_IF(actual != sizeof(T), "Failed to read ", sizeof(T), " bytes at offset ",
                             tell() - actual, ": only ", actual, " available");

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            fourcc read_fourcc();

            /**
             * @defgroup SourceFactories Source normalization
             *
             * Pick the cheapest backend for a given kind of input.
             * @{
             */
            static std::unique_ptr<source> open(std::unique_ptr<source> src);
            static std::unique_ptr<source> open(std::vector<std::byte> bytes);
            static std::unique_ptr<source> open(const void* data, std::size_t size);
            static std::unique_ptr<source> open(std::istream& stream);

            /**
             * @brief Open a file by path
             * @param path File to open
             * @param prefer_mmap Map the file instead of reading through a stream
             * @throws io_error if the file cannot be opened or mapped
             */
            static std::unique_ptr<source> open(const std::filesystem::path& path, bool prefer_mmap = false);
            /** @} */

        protected:
            source() = default;

            // New cursor position for a seek request, clamped at 0
            static std::uint64_t resolve_seek(std::uint64_t current, std::uint64_t length,
                                              std::int64_t offset, whence_t whence);
    };

    /**
     * @class buffer_source
     * @brief Common base for backends whose bytes are directly addressable
     */
    class RIFFLE_EXPORT buffer_source : public source {
        public:
            using source::read;

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::int64_t offset, whence_t whence = set) override;
            std::uint64_t tell() const override { return m_position; }
            std::uint64_t size() const override { return m_size; }
            std::size_t read_at(std::uint64_t offset, void* dst, std::size_t size) override;

            [[nodiscard]] const std::byte* data() const { return m_data; }

        protected:
            buffer_source() = default;
            void attach(const std::byte* data, std::uint64_t size);

        private:
            const std::byte* m_data = nullptr;
            std::uint64_t m_size = 0;
            std::uint64_t m_position = 0;
    };

    /**
     * @class memory_source
     * @brief In-memory byte block owned by the source
     */
    class RIFFLE_EXPORT memory_source : public buffer_source {
        public:
            explicit memory_source(std::vector<std::byte> bytes);
            memory_source(const void* data, std::size_t size);

        private:
            std::vector<std::byte> m_bytes;
    };

    /**
     * @class mapped_source
     * @brief Read-only memory mapping of a whole file
     *
     * Seeking only moves an offset, it never touches the file.
     * Several mapped sources over the same file are independent.
     */
    class RIFFLE_EXPORT mapped_source : public buffer_source {
        public:
            explicit mapped_source(const std::filesystem::path& path);
            ~mapped_source() override;

        private:
            void close() noexcept;

#if defined(_WIN32)
            void* m_file_handle = nullptr;
            void* m_map_handle = nullptr;
#else
            int m_fd = -1;
#endif
            void* m_view = nullptr;
            std::uint64_t m_length = 0;
    };

    /**
     * @class stream_source
     * @brief Seekable std::istream with its length probed up front
     *
     * The stream is not owned. Its get position is only a transport
     * detail: the source keeps its own cursor.
     */
    class RIFFLE_EXPORT stream_source : public source {
        public:
            using source::read;

            explicit stream_source(std::istream& is);
            ~stream_source() override;

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::int64_t offset, whence_t whence = set) override;
            std::uint64_t tell() const override { return m_position; }
            std::uint64_t size() const override { return m_size; }
            std::size_t read_at(std::uint64_t offset, void* dst, std::size_t size) override;

        protected:
            explicit stream_source(std::unique_ptr<std::istream> owned);

        private:
            std::size_t fetch(std::uint64_t offset, void* dst, std::size_t size);
            void probe_length();

            std::unique_ptr<std::istream> m_owned;
            std::istream* m_stream;
            std::uint64_t m_size = 0;
            std::uint64_t m_position = 0;
    };

    /**
     * @class file_source
     * @brief File opened by path, read through an owned file stream
     */
    class RIFFLE_EXPORT file_source : public stream_source {
        public:
            explicit file_source(const std::filesystem::path& path);

            [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        private:
            std::filesystem::path m_path;
    };

} // namespace riffle
