#pragma once

// The write stream: a handshake that establishes the stream token, then
// batches of mutations, each answered with one WriteResponse.
//
// Internal header — not installed.

#include "stream.hpp"

#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/mutation.hpp>

#include <memory>
#include <vector>

namespace docsync_cpp::remote {

class WriteStreamCallback {
public:
    virtual ~WriteStreamCallback() = default;

    virtual void on_write_stream_open() = 0;
    virtual void on_write_stream_handshake_complete() = 0;
    virtual void on_write_stream_mutation_result(SnapshotVersion commit_version,
                                                 std::vector<MutationResult> results) = 0;
    virtual void on_write_stream_close(const Error& status) = 0;
};

class WriteStream final : public Stream {
public:
    WriteStream(util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
                std::shared_ptr<CredentialsProvider> credentials, std::shared_ptr<AppCheckProvider> app_check,
                WriteStreamCallback& callback);

    ~WriteStream() override;

    // Sent with the handshake; updated by every response.
    void set_last_stream_token(ByteString token) { last_stream_token_ = std::move(token); }
    auto last_stream_token() const -> const ByteString& { return last_stream_token_; }

    auto handshake_complete() const -> bool { return handshake_complete_; }

    void write_handshake();
    void write_mutations(const std::vector<Mutation>& mutations);

protected:
    void open_connection(const StreamTokens& tokens) override;
    void close_connection() override;
    void notify_stream_open() override { callback_.on_write_stream_open(); }
    void notify_stream_close(const Error& status) override;
    auto name() const -> std::string_view override { return "write"; }

private:
    class Observer;

    void handle_write_response(WriteResponse response);

    WriteStreamCallback& callback_;
    std::unique_ptr<WriteStreamConnection> connection_;
    ByteString last_stream_token_;
    bool handshake_complete_{false};
};

}  // namespace docsync_cpp::remote
