#include "ingestion.hpp"
#include "media_type.hpp"
#include "thumbnailer.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"
#include <system_error>

namespace tinyboard::media {

namespace {

void remove_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        TINYBOARD_LOG_DEBUG("Removed {}", path.string());
    } else if (ec) {
        TINYBOARD_LOG_WARN("Could not remove {}: {}", path.string(), ec.message());
    }
}

void ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw MediaException(ErrorCode::IoError,
                             "cannot create " + dir.string() + ": " + ec.message());
    }
}

} // anonymous namespace

// MediaUpload

MediaUpload::MediaUpload(Key,
                         board::MediaKind kind,
                         std::optional<ImageFormat> format,
                         std::string stored_name,
                         std::filesystem::path file_path,
                         std::filesystem::path thumb_dir,
                         size_t max_bytes)
    : kind_(kind)
    , format_(format)
    , stored_name_(std::move(stored_name))
    , file_path_(std::move(file_path))
    , thumb_dir_(std::move(thumb_dir))
    , max_bytes_(max_bytes)
{}

MediaUpload::~MediaUpload() {
    if (!finished_) {
        if (!failed_) {
            TINYBOARD_LOG_DEBUG("Upload {} abandoned after {} bytes", stored_name_, bytes_written_);
        }
        remove_partial();
    }
}

Result<void> MediaUpload::open() {
    out_.open(file_path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        failed_ = true;
        return Error(ErrorCode::IoError, "Cannot create " + file_path_.string());
    }
    return Result<void>::Ok();
}

void MediaUpload::remove_partial() {
    if (out_.is_open()) {
        out_.close();
    }
    remove_file(file_path_);
}

Result<void> MediaUpload::write(const char* data, size_t size) {
    if (failed_ || finished_) {
        return Error(ErrorCode::InvalidArgument, "Upload " + stored_name_ + " is closed");
    }

    if (size > max_bytes_ - bytes_written_) {
        failed_ = true;
        remove_partial();
        return Error(ErrorCode::PayloadTooLarge,
                     "Upload exceeds " + std::to_string(max_bytes_) + " bytes");
    }

    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        failed_ = true;
        remove_partial();
        return Error(ErrorCode::IoError, "Failed to write " + file_path_.string());
    }

    bytes_written_ += size;
    return Result<void>::Ok();
}

Result<MediaAttachment> MediaUpload::finish() {
    if (failed_ || finished_) {
        return Error(ErrorCode::InvalidArgument, "Upload " + stored_name_ + " is closed");
    }

    out_.close();
    if (out_.fail()) {
        failed_ = true;
        remove_partial();
        return Error(ErrorCode::IoError, "Failed to close " + file_path_.string());
    }

    if (kind_ == board::MediaKind::Video) {
        // Only the extension is checked for video
        finished_ = true;
        MediaAttachment attachment;
        attachment.ref.url = std::string(constants::VIDEO_UPLOAD_URL_PREFIX) + stored_name_;
        attachment.ref.kind = board::MediaKind::Video;
        attachment.stored_files.push_back(file_path_);
        TINYBOARD_LOG_INFO("Stored video {} ({} bytes)", stored_name_, bytes_written_);
        return Result<MediaAttachment>::Ok(std::move(attachment));
    }

    auto attachment = finish_image();
    if (attachment.is_err()) {
        failed_ = true;
        remove_partial();
        return attachment.error();
    }
    finished_ = true;
    return attachment;
}

Result<MediaAttachment> MediaUpload::finish_image() {
    auto image = ImageCodec::decode_file(file_path_, *format_);
    if (image.is_err()) {
        TINYBOARD_LOG_INFO("Rejected upload {}: {}", stored_name_, image.error().to_string());
        return image.error();
    }

    MediaAttachment attachment;
    attachment.ref.kind = board::MediaKind::Image;
    attachment.ref.url = std::string(constants::IMAGE_UPLOAD_URL_PREFIX) + stored_name_;
    attachment.stored_files.push_back(file_path_);

    if (*format_ == ImageFormat::Gif) {
        // Served as-is so animation survives
        TINYBOARD_LOG_INFO("Stored gif {} ({}x{})", stored_name_,
                           image.value().width, image.value().height);
        return Result<MediaAttachment>::Ok(std::move(attachment));
    }

    const std::string thumb_name = "thumb_" + stored_name_;
    const auto thumb_path = thumb_dir_ / thumb_name;

    auto thumbnail = Thumbnailer::make_thumbnail(image.value());
    auto encoded = ImageCodec::encode_file(thumbnail, *format_, thumb_path);
    if (encoded.is_err()) {
        TINYBOARD_LOG_WARN("Thumbnail for {} failed, using original: {}",
                           stored_name_, encoded.error().to_string());
        remove_file(thumb_path);
        return Result<MediaAttachment>::Ok(std::move(attachment));
    }

    attachment.ref.url = std::string(constants::IMAGE_THUMB_URL_PREFIX) + thumb_name;
    attachment.stored_files.push_back(thumb_path);

    TINYBOARD_LOG_INFO("Stored image {} ({}x{}, thumbnail {}x{})", stored_name_,
                       image.value().width, image.value().height,
                       thumbnail.width, thumbnail.height);
    return Result<MediaAttachment>::Ok(std::move(attachment));
}

// MediaIngestionPipeline

MediaIngestionPipeline::MediaIngestionPipeline(MediaPaths paths, size_t max_upload_bytes)
    : paths_(std::move(paths))
    , max_upload_bytes_(max_upload_bytes)
{
    ensure_directory(paths_.image_upload_dir);
    ensure_directory(paths_.video_upload_dir);
    ensure_directory(paths_.image_thumb_dir);
}

Result<std::unique_ptr<MediaUpload>> MediaIngestionPipeline::begin(
    const std::string& field_name, const std::string& filename) const {

    if (field_name != MEDIA_FIELD || is_blank(filename)) {
        return Result<std::unique_ptr<MediaUpload>>::Ok(nullptr);
    }

    auto guess = MediaTypeGuess::from_filename(trim(filename));

    std::unique_ptr<MediaUpload> upload;
    if (guess.is_image()) {
        auto format = image_format_from_subtype(guess.subtype);
        if (!format) {
            return Error(ErrorCode::UnsupportedMediaType,
                         "Unsupported image type: " + guess.essence());
        }
        auto name = crypto::Random::uuid_v4() + "." + guess.subtype;
        auto path = paths_.image_upload_dir / name;
        upload = std::make_unique<MediaUpload>(MediaUpload::Key(), board::MediaKind::Image,
                                               format, name, path, paths_.image_thumb_dir,
                                               max_upload_bytes_);
    } else if (guess.is_video()) {
        if (guess.subtype != "mp4") {
            return Error(ErrorCode::UnsupportedMediaType,
                         "Unsupported video type: " + guess.essence());
        }
        auto name = crypto::Random::uuid_v4() + "." + guess.subtype;
        auto path = paths_.video_upload_dir / name;
        upload = std::make_unique<MediaUpload>(MediaUpload::Key(), board::MediaKind::Video,
                                               std::nullopt, name, path, paths_.image_thumb_dir,
                                               max_upload_bytes_);
    } else {
        return Error(ErrorCode::UnsupportedMediaType,
                     "Unsupported media type: " + guess.essence());
    }

    auto opened = upload->open();
    if (opened.is_err()) {
        TINYBOARD_LOG_ERROR("Upload failed: {}", opened.error().to_string());
        return opened.error();
    }

    TINYBOARD_LOG_DEBUG("Receiving {} as {}", filename, upload->stored_name());
    return Result<std::unique_ptr<MediaUpload>>::Ok(std::move(upload));
}

Result<std::optional<MediaAttachment>> MediaIngestionPipeline::ingest(
    const std::string& field_name, const std::string& filename, const ChunkSource& source) const {

    auto started = begin(field_name, filename);
    if (started.is_err()) {
        return started.error();
    }
    auto upload = started.unwrap();
    if (!upload) {
        return Result<std::optional<MediaAttachment>>::Ok(std::nullopt);
    }

    std::string chunk;
    while (source(chunk)) {
        TINYBOARD_TRY(upload->write(chunk.data(), chunk.size()));
        chunk.clear();
    }

    auto attachment = upload->finish();
    if (attachment.is_err()) {
        return attachment.error();
    }
    return Result<std::optional<MediaAttachment>>::Ok(attachment.unwrap());
}

void MediaIngestionPipeline::discard(const MediaAttachment& attachment) const {
    for (const auto& path : attachment.stored_files) {
        remove_file(path);
    }
}

} // namespace tinyboard::media
