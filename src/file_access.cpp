#include "beamproto/file_access.hpp"

#include <fstream>
#include <system_error>

#include "beamproto/errors.hpp"

namespace BeamProto {

namespace {

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path) : in_(path, std::ios::binary) {
        if (!in_) {
            throw IoError("Cannot open " + path.string() + " for reading.");
        }
    }

    size_t read_some(uint8_t* data, size_t size) override {
        in_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
        if (in_.bad()) {
            throw IoError("Read error.");
        }
        return static_cast<size_t>(in_.gcount());
    }

private:
    std::ifstream in_;
};

class FileSink : public ByteSink {
public:
    explicit FileSink(const std::filesystem::path& path)
        : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
        if (!out_) {
            throw IoError("Cannot open " + path.string() + " for writing.");
        }
    }

    void write_all(const uint8_t* data, size_t size) override {
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out_) {
            throw IoError("Write error on " + path_.string());
        }
    }

    void flush() override {
        out_.flush();
        if (!out_) {
            throw IoError("Flush error on " + path_.string());
        }
    }

private:
    std::filesystem::path path_;
    std::ofstream out_;
};

} // namespace

LocalFileAccess::LocalFileAccess(std::filesystem::path receive_dir) : receive_dir_(std::move(receive_dir)) {}

std::string LocalFileAccess::resolve_name(const FileHandle& handle) {
    std::string name = std::filesystem::path(handle).filename().string();
    return name.empty() ? std::string("unknown") : name;
}

uint64_t LocalFileAccess::resolve_size(const FileHandle& handle) {
    std::error_code ec;
    auto size = std::filesystem::file_size(handle, ec);
    if (ec) {
        throw IoError("Cannot stat " + handle + ": " + ec.message());
    }
    return size;
}

std::unique_ptr<ByteSource> LocalFileAccess::open_for_read(const FileHandle& handle) {
    return std::make_unique<FileSource>(handle);
}

std::unique_ptr<ByteSink> LocalFileAccess::open_for_write(const std::filesystem::path& path) {
    return std::make_unique<FileSink>(path);
}

std::filesystem::path LocalFileAccess::receive_directory() {
    std::error_code ec;
    std::filesystem::create_directories(receive_dir_, ec);
    if (ec) {
        throw IoError("Cannot create " + receive_dir_.string() + ": " + ec.message());
    }
    return receive_dir_;
}

} // namespace BeamProto
