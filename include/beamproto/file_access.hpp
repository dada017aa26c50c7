#ifndef BEAMPROTO_FILE_ACCESS_HPP
#define BEAMPROTO_FILE_ACCESS_HPP

#include "byte_stream.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace BeamProto {

    // Opaque reference to a file chosen by the user (a path, a content URI, ...).
    using FileHandle = std::string;

    /**
     * @brief Access to the files being sent and to the receive directory.
     */
    class FileAccess {
    public:
        virtual ~FileAccess() = default;

        virtual std::string resolve_name(const FileHandle& handle) = 0;
        virtual uint64_t resolve_size(const FileHandle& handle) = 0;
        virtual std::unique_ptr<ByteSource> open_for_read(const FileHandle& handle) = 0;

        // Creates or truncates the file at path.
        virtual std::unique_ptr<ByteSink> open_for_write(const std::filesystem::path& path) = 0;

        virtual std::filesystem::path receive_directory() = 0;
    };

    /**
     * @brief FileAccess over the local file system. Handles are paths.
     */
    class LocalFileAccess : public FileAccess {
    public:
        explicit LocalFileAccess(std::filesystem::path receive_dir);

        std::string resolve_name(const FileHandle& handle) override;
        uint64_t resolve_size(const FileHandle& handle) override;
        std::unique_ptr<ByteSource> open_for_read(const FileHandle& handle) override;
        std::unique_ptr<ByteSink> open_for_write(const std::filesystem::path& path) override;
        std::filesystem::path receive_directory() override;

    private:
        std::filesystem::path receive_dir_;
    };

} // namespace BeamProto

#endif // BEAMPROTO_FILE_ACCESS_HPP
