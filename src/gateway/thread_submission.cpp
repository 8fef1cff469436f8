#include "thread_submission.hpp"
#include "../board/repository.hpp"
#include "../utils/logger.hpp"

namespace tinyboard {
namespace gateway {

namespace {

// Text fields are capped well above the validation limits (4 bytes per code point)
constexpr size_t MAX_TITLE_BYTES = constants::MAX_TITLE_LENGTH * 4 + 256;
constexpr size_t MAX_MESSAGE_BYTES = constants::MAX_MESSAGE_LENGTH * 4 + 256;

} // anonymous namespace

ThreadSubmission::ThreadSubmission(board::ContentRepository& repository,
                                   const media::MediaIngestionPipeline& pipeline)
    : repository_(repository)
    , pipeline_(pipeline)
{}

ThreadSubmission::~ThreadSubmission() {
    // Neither stored nor handed out: nothing references these files
    if (attachment_) {
        pipeline_.discard(*attachment_);
    }
}

bool ThreadSubmission::fail(Error error) {
    if (!error_) {
        error_ = std::move(error);
    }
    upload_.reset();
    return false;
}

Result<void> ThreadSubmission::close_upload() {
    if (!upload_) {
        return Result<void>::Ok();
    }
    auto upload = std::move(upload_);
    auto attachment = upload->finish();
    if (attachment.is_err()) {
        return attachment.error();
    }
    attachment_ = attachment.unwrap();
    return Result<void>::Ok();
}

bool ThreadSubmission::on_part(const std::string& name, const std::string& filename) {
    if (error_) {
        return false;
    }

    auto closed = close_upload();
    if (closed.is_err()) {
        return fail(closed.error());
    }

    if (name == "title") {
        field_ = Field::Title;
    } else if (name == "message") {
        field_ = Field::Message;
    } else if (name == media::MediaIngestionPipeline::MEDIA_FIELD && !attachment_) {
        auto started = pipeline_.begin(name, filename);
        if (started.is_err()) {
            return fail(started.error());
        }
        upload_ = started.unwrap();
        field_ = upload_ ? Field::Media : Field::Ignored;
    } else {
        // Unknown fields and any second media part are dropped
        field_ = Field::Ignored;
    }
    return true;
}

bool ThreadSubmission::on_data(const char* data, size_t size) {
    if (error_) {
        return false;
    }

    switch (field_) {
        case Field::Title:
            if (title_.size() + size > MAX_TITLE_BYTES) {
                return fail(Error(ErrorCode::ValidationFailed, "Title is too long"));
            }
            title_.append(data, size);
            return true;

        case Field::Message:
            if (message_.size() + size > MAX_MESSAGE_BYTES) {
                return fail(Error(ErrorCode::ValidationFailed, "Message is too long"));
            }
            message_.append(data, size);
            return true;

        case Field::Media: {
            auto written = upload_->write(data, size);
            if (written.is_err()) {
                return fail(written.error());
            }
            return true;
        }

        case Field::None:
        case Field::Ignored:
            return true;
    }
    return true;
}

Result<board::Thread> ThreadSubmission::finish(bool body_complete) {
    if (error_) {
        return *error_;
    }
    if (!body_complete) {
        upload_.reset();
        return Error(ErrorCode::InvalidArgument, "The upload was interrupted");
    }

    auto closed = close_upload();
    if (closed.is_err()) {
        return closed.error();
    }

    std::optional<board::MediaRef> media;
    if (attachment_) {
        media = attachment_->ref;
    }

    auto thread = repository_.create_thread(title_, message_, media);
    if (thread.is_err()) {
        if (!is_client_error(thread.error().code())) {
            TINYBOARD_LOG_ERROR("Failed to store thread: {}", thread.error().to_string());
        }
        // Destructor discards the attachment
        return thread.error();
    }

    attachment_.reset();
    return thread;
}

} // namespace gateway
} // namespace tinyboard
