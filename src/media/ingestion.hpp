#pragma once

#include "image_codec.hpp"
#include "board/model.hpp"
#include "tinyboard/error.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tinyboard::media {

/**
 * Directories that receive uploads and derived thumbnails
 */
struct MediaPaths {
    std::filesystem::path image_upload_dir{"./uploads/images/"};
    std::filesystem::path video_upload_dir{"./uploads/videos/"};
    std::filesystem::path image_thumb_dir{"./thumbs/images/"};
};

/**
 * An accepted upload
 */
struct MediaAttachment {
    board::MediaRef ref;                              // what the thread record stores
    std::vector<std::filesystem::path> stored_files;  // original first, then thumbnail
};

/**
 * Pulls the next chunk of an upload into `chunk`; returns false at end of stream
 */
using ChunkSource = std::function<bool(std::string& chunk)>;

/**
 * One upload in progress, streamed to a uniquely named file.
 *
 * Destroying an upload that was never finished (or whose finish failed)
 * removes whatever was written.
 */
class MediaUpload {
    // Only the pipeline can name this, so only it can construct uploads
    class Key {
        friend class MediaIngestionPipeline;
        Key() {}
    };

public:
    MediaUpload(Key key,
                board::MediaKind kind,
                std::optional<ImageFormat> format,
                std::string stored_name,
                std::filesystem::path file_path,
                std::filesystem::path thumb_dir,
                size_t max_bytes);
    ~MediaUpload();

    TINYBOARD_DISALLOW_COPY_AND_MOVE(MediaUpload);

    /**
     * Append a chunk. Fails with InvalidMedia once the size limit is
     * exceeded and IoError if the disk write fails; the partial file is
     * removed in both cases.
     */
    Result<void> write(const char* data, size_t size);

    /**
     * Close the file and validate it. Images are decoded as their declared
     * format and, except GIF, get a thumbnail.
     */
    Result<MediaAttachment> finish();

    board::MediaKind kind() const { return kind_; }
    const std::string& stored_name() const { return stored_name_; }
    const std::filesystem::path& file_path() const { return file_path_; }
    size_t bytes_written() const { return bytes_written_; }

private:
    friend class MediaIngestionPipeline;

    Result<void> open();
    Result<MediaAttachment> finish_image();
    void remove_partial();

    board::MediaKind kind_;
    std::optional<ImageFormat> format_;
    std::string stored_name_;
    std::filesystem::path file_path_;
    std::filesystem::path thumb_dir_;
    size_t max_bytes_;

    std::ofstream out_;
    size_t bytes_written_{0};
    bool failed_{false};
    bool finished_{false};
};

/**
 * Classifies, stores and validates uploaded media.
 *
 * Images (jpeg, png, gif, webp) go to the image directory and, apart from
 * GIF, get a thumbnail of at most 200x200 in the thumbnail directory.
 * Videos (mp4 only) go to the video directory unvalidated. Uploads are
 * never held in memory as a whole.
 */
class MediaIngestionPipeline {
public:
    static constexpr const char* MEDIA_FIELD = "media";

    /**
     * @param paths Target directories, created if missing
     * @param max_upload_bytes Per-upload size limit
     * @throws MediaException if a directory cannot be created
     */
    explicit MediaIngestionPipeline(MediaPaths paths,
                                    size_t max_upload_bytes = constants::DEFAULT_MAX_UPLOAD_BYTES);

    /**
     * Start an upload for a form field.
     * @return nullptr when there is nothing to ingest (other field, or an
     *         empty filename); UnsupportedMediaType for anything that is
     *         not an accepted image or video; IoError if the file cannot
     *         be created
     */
    Result<std::unique_ptr<MediaUpload>> begin(const std::string& field_name,
                                               const std::string& filename) const;

    /**
     * Pull a whole upload from a chunk source
     * @return nullopt when there is nothing to ingest
     */
    Result<std::optional<MediaAttachment>> ingest(const std::string& field_name,
                                                  const std::string& filename,
                                                  const ChunkSource& source) const;

    /**
     * Remove the files of an attachment whose thread was never stored
     */
    void discard(const MediaAttachment& attachment) const;

    const MediaPaths& paths() const { return paths_; }
    size_t max_upload_bytes() const { return max_upload_bytes_; }

private:
    MediaPaths paths_;
    size_t max_upload_bytes_;
};

} // namespace tinyboard::media
