#include "write_stream.hpp"

#include "../util/hard_assert.hpp"
#include "../util/log.hpp"

namespace docsync_cpp::remote {

class WriteStream::Observer final : public WriteStreamObserver {
public:
    explicit Observer(ConnectionDispatcher<WriteStream> dispatch) : dispatch_{std::move(dispatch)} {}

    void on_stream_open() override {
        dispatch_([](WriteStream& stream) { stream.handle_stream_open(); });
    }

    void on_write_response(WriteResponse response) override {
        dispatch_([response = std::move(response)](WriteStream& stream) { stream.handle_write_response(response); });
    }

    void on_stream_close(Error status) override {
        dispatch_([status = std::move(status)](WriteStream& stream) { stream.handle_stream_close(status); });
    }

private:
    ConnectionDispatcher<WriteStream> dispatch_;
};

WriteStream::WriteStream(util::AsyncQueue& queue, std::shared_ptr<Datastore> datastore,
                         std::shared_ptr<CredentialsProvider> credentials,
                         std::shared_ptr<AppCheckProvider> app_check, WriteStreamCallback& callback)
    : Stream{queue, std::move(datastore), std::move(credentials), std::move(app_check),
             util::TimerId::write_stream_connection_backoff, util::TimerId::write_stream_idle},
      callback_{callback} {}

WriteStream::~WriteStream() {
    if (connection_) connection_->close();
}

void WriteStream::open_connection(const StreamTokens& tokens) {
    handshake_complete_ = false;
    auto self = std::static_pointer_cast<WriteStream>(shared_from_this());
    auto observer = std::make_shared<Observer>(ConnectionDispatcher<WriteStream>{queue(), self, generation()});
    connection_ = datastore().open_write_stream(tokens, std::move(observer));
    util::hard_assert(connection_ != nullptr, "datastore returned no write connection");
}

void WriteStream::close_connection() {
    if (!connection_) return;
    connection_->close();
    connection_.reset();
}

void WriteStream::notify_stream_close(const Error& status) {
    callback_.on_write_stream_close(status);
    // The callback still needs to know whether the handshake had completed
    handshake_complete_ = false;
}

void WriteStream::write_handshake() {
    util::hard_assert(is_open(), "handshake on a closed write stream");
    util::hard_assert(!handshake_complete_, "handshake already completed");
    util::logger()->debug("write stream: handshake with {} byte stream token", last_stream_token_.size());
    connection_->write_handshake();
}

void WriteStream::write_mutations(const std::vector<Mutation>& mutations) {
    util::hard_assert(is_open(), "writing on a closed write stream");
    util::hard_assert(handshake_complete_, "writing before the handshake completed");
    cancel_idle_check();
    util::logger()->debug("write stream: writing {} mutations", mutations.size());
    connection_->write(last_stream_token_, mutations);
}

void WriteStream::handle_write_response(WriteResponse response) {
    last_stream_token_ = std::move(response.stream_token);

    if (!handshake_complete_) {
        // The first response answers the handshake
        handshake_complete_ = true;
        callback_.on_write_stream_handshake_complete();
        return;
    }

    // A write result proves the stream works; a handshake alone does not
    on_message_received();
    callback_.on_write_stream_mutation_result(response.commit_version, std::move(response.mutation_results));
}

}  // namespace docsync_cpp::remote
