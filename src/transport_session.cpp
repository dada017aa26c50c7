#include "beamproto/transport_session.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

namespace BeamProto {

namespace {

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Closes the stream when the session body leaves scope, on every path.
class StreamCloser {
public:
    explicit StreamCloser(ByteStream& stream) : stream_(stream) {}
    ~StreamCloser() { stream_.close(); }

    StreamCloser(const StreamCloser&) = delete;
    StreamCloser& operator=(const StreamCloser&) = delete;

private:
    ByteStream& stream_;
};

void warn_size_mismatch(const std::string& session_id, uint64_t announced, uint64_t framed) {
    if (announced != framed) {
        std::cerr << "[BeamProto] Session " << session_id << ": handshake announced " << announced
                  << " bytes but file headers carry " << framed << " bytes" << std::endl;
    }
}

} // namespace

const char* to_string(Role role) {
    return role == Role::SENDER ? "sender" : "receiver";
}

TransferOutcome TransferOutcome::failure(ErrorCode code, std::string message) {
    TransferOutcome outcome;
    outcome.error = code;
    outcome.message = std::move(message);
    return outcome;
}

std::string sanitize_received_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.find('\0') != std::string::npos ||
        name.find('\\') != std::string::npos) {
        throw ProtocolError("Refusing unsafe file name '" + name + "'.");
    }
    std::filesystem::path path = std::filesystem::u8path(name);
    if (path.has_root_path() || path.has_parent_path()) {
        throw ProtocolError("Refusing file name with a directory part: '" + name + "'.");
    }
    return name;
}

TransportSession::TransportSession(ByteStream& stream, Role role, const SessionToken& token, FileAccess& files,
                                   HistorySink& history, SessionConfig config)
    : stream_(stream), role_(role), token_(token), files_(files), history_(history), config_(config) {}

void TransportSession::cancel() {
    cancelled_ = true;
    stream_.close();
}

TransferOutcome TransportSession::run(const TransferMetadata& metadata, const std::vector<FileHandle>& handles,
                                      const ProgressCallback& progress) {
    if (role_ == Role::SENDER) {
        return run_sender(metadata, handles, progress);
    }
    return run_receiver(progress);
}

TransferOutcome TransportSession::run_sender(const TransferMetadata& metadata,
                                             const std::vector<FileHandle>& handles,
                                             const ProgressCallback& progress) {
    if (role_ != Role::SENDER) {
        throw LogicError("run_sender called on a receiving session.");
    }

    TransferOutcome outcome;
    std::optional<TransferRecord> record;
    try {
        StreamCloser closer(stream_);
        send_body(metadata, handles, progress, record);
    } catch (const Exception& e) {
        outcome = TransferOutcome::failure(e.code(), e.what());
    } catch (const std::exception& e) {
        outcome = TransferOutcome::failure(ErrorCode::Unknown, e.what());
    }
    outcome.record = std::move(record);
    return finish(std::move(outcome));
}

TransferOutcome TransportSession::run_receiver(const ProgressCallback& progress) {
    if (role_ != Role::RECEIVER) {
        throw LogicError("run_receiver called on a sending session.");
    }

    TransferOutcome outcome;
    std::optional<TransferMetadata> announced;
    std::optional<TransferRecord> record;
    try {
        StreamCloser closer(stream_);
        receive_body(progress, announced, record);
    } catch (const Exception& e) {
        outcome = TransferOutcome::failure(e.code(), e.what());
    } catch (const std::exception& e) {
        outcome = TransferOutcome::failure(ErrorCode::Unknown, e.what());
    }
    outcome.record = std::move(record);
    outcome.metadata = std::move(announced);
    return finish(std::move(outcome));
}

TransferOutcome TransportSession::finish(TransferOutcome outcome) {
    if (!outcome.ok() && cancelled_) {
        outcome.error = ErrorCode::Cancelled;
        outcome.message = "Transfer cancelled: " + outcome.message;
    }

    if (outcome.record) {
        if (!outcome.ok()) {
            outcome.record->complete = false;
        }
        append_history(*outcome.record);
    }

    if (!outcome.ok()) {
        std::cerr << "[BeamProto] Session " << token_.id << " (" << to_string(role_)
                  << ") failed: " << to_string(outcome.error) << ": " << outcome.message << std::endl;
        return outcome;
    }

    if (config_.verbose) {
        std::cerr << "[BeamProto] Session " << token_.id << " (" << to_string(role_) << ") completed: "
                  << outcome.record->name << ", " << outcome.record->size << " bytes" << std::endl;
    }
    return outcome;
}

// History failures do not turn a transfer result into a different one.
void TransportSession::append_history(const TransferRecord& record) {
    try {
        history_.append(record);
    } catch (const std::exception& e) {
        std::cerr << "[BeamProto] Session " << token_.id << ": history append failed: " << e.what() << std::endl;
    }
}

void TransportSession::send_body(const TransferMetadata& metadata, const std::vector<FileHandle>& handles,
                                 const ProgressCallback& progress, std::optional<TransferRecord>& record) {
    if (handles.size() > UINT32_MAX) {
        throw InvalidArgument("Too many files for one session.");
    }

    // Resolve every file before the first byte goes out, so a missing file fails cleanly.
    std::vector<FileHeader> headers;
    headers.reserve(handles.size());
    uint64_t framed_total = 0;
    for (const auto& handle : handles) {
        FileHeader header;
        header.name = files_.resolve_name(handle);
        header.size = files_.resolve_size(handle);
        framed_total += header.size;
        headers.push_back(std::move(header));
    }
    warn_size_mismatch(token_.id, metadata.total_size, framed_total);

    TransferMetadata announced = metadata;
    announced.files.clear();
    announced.file_count = static_cast<uint32_t>(handles.size());

    FrameWriter writer(stream_, config_.chunk_size);
    writer.write_handshake(HandshakeCodec::create_message(token_, announced));

    record = TransferRecord{metadata.display_name, metadata.total_size, now_millis(), Direction::SEND, false};
    writer.write_file_count(announced.file_count);

    ProgressTracker tracker(metadata.total_size, progress);
    for (size_t i = 0; i < handles.size(); ++i) {
        writer.write_file_header(headers[i]);
        std::unique_ptr<ByteSource> source = files_.open_for_read(handles[i]);
        writer.write_payload(*source, headers[i].size, tracker);
    }

    record->timestamp = now_millis();
    record->complete = true;
}

void TransportSession::receive_body(const ProgressCallback& progress, std::optional<TransferMetadata>& announced,
                                    std::optional<TransferRecord>& record) {
    FrameReader reader(stream_, config_);

    byte_vector sealed = reader.read_handshake();
    TransferMetadata metadata = HandshakeCodec::parse_message(token_, sealed);
    announced = metadata;
    record = TransferRecord{metadata.display_name, metadata.total_size, now_millis(), Direction::RECEIVE, false};

    uint32_t count = reader.read_file_count();
    if (count != metadata.file_count) {
        std::cerr << "[BeamProto] Session " << token_.id << ": handshake announced " << metadata.file_count
                  << " files but the stream carries " << count << std::endl;
    }

    std::filesystem::path directory = files_.receive_directory();
    ProgressTracker tracker(metadata.total_size, progress);
    uint64_t framed_total = 0;
    for (uint32_t i = 0; i < count; ++i) {
        FileHeader header = reader.read_file_header();
        std::string name = sanitize_received_name(header.name);
        framed_total += header.size;

        std::unique_ptr<ByteSink> sink = files_.open_for_write(directory / std::filesystem::u8path(name));
        reader.read_payload(*sink, header.size, tracker);
        announced->files.push_back(FileEntry{name, header.size});
    }
    warn_size_mismatch(token_.id, metadata.total_size, framed_total);

    record->timestamp = now_millis();
    record->complete = true;
}

} // namespace BeamProto
