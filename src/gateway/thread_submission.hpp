#pragma once

#include "tinyboard/error.hpp"
#include "../board/model.hpp"
#include "../media/ingestion.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tinyboard {

namespace board { class ContentRepository; }

namespace gateway {

/**
 * Collects one multipart "create thread" request.
 *
 * Parts arrive as on_part() followed by any number of on_data() calls.
 * Text fields (title, message) are buffered; the media field is streamed
 * straight into the ingestion pipeline. Returning false from either
 * callback tells the transport to stop reading.
 */
class ThreadSubmission {
public:
    ThreadSubmission(board::ContentRepository& repository,
                     const media::MediaIngestionPipeline& pipeline);
    ~ThreadSubmission();

    TINYBOARD_DISALLOW_COPY_AND_MOVE(ThreadSubmission);

    bool on_part(const std::string& name, const std::string& filename);
    bool on_data(const char* data, size_t size);

    /**
     * Finish the upload and store the thread. Uploaded files are removed
     * if the thread is not stored.
     * @param body_complete False when the transport failed to read the
     *        whole body
     */
    Result<board::Thread> finish(bool body_complete = true);

private:
    enum class Field {
        None,
        Title,
        Message,
        Media,
        Ignored
    };

    bool fail(Error error);
    Result<void> close_upload();

    board::ContentRepository& repository_;
    const media::MediaIngestionPipeline& pipeline_;

    Field field_{Field::None};
    std::string title_;
    std::string message_;
    std::unique_ptr<media::MediaUpload> upload_;
    std::optional<media::MediaAttachment> attachment_;
    std::optional<Error> error_;
};

} // namespace gateway
} // namespace tinyboard
