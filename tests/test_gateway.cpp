#include "tinyboard/gateway/board_server.hpp"
#include "tinyboard/gateway/page_renderer.hpp"
#include "gateway/thread_submission.hpp"
#include "board/pagination.hpp"
#include "board/repository.hpp"
#include "media/ingestion.hpp"
#include "media/image_codec.hpp"
#include "storage/kv_store.hpp"
#include "utils/logger.hpp"
#include "tinyboard/common.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace tinyboard;
using namespace tinyboard::gateway;

namespace fs = std::filesystem;

// ============================================================================
// Page renderer
// ============================================================================

TEST(PageRendererTest, EscapeHtml) {
    EXPECT_EQ(escape_html("plain"), "plain");
    EXPECT_EQ(escape_html("<script>alert('x')</script>"),
              "&lt;script&gt;alert(&#x27;x&#x27;)&lt;&#x2F;script&gt;");
    EXPECT_EQ(escape_html("a & \"b\""), "a &amp; &quot;b&quot;");
}

TEST(PageRendererTest, EmptyHomepage) {
    PageRenderer renderer;
    auto html = renderer.render_homepage(board::paginate({}, 1));

    EXPECT_NE(html.find("No threads found"), std::string::npos);
    EXPECT_NE(html.find("action=\"/thread\""), std::string::npos);
    EXPECT_NE(html.find("maxlength=\"75\""), std::string::npos);
    EXPECT_NE(html.find("maxlength=\"8000\""), std::string::npos);
    EXPECT_EQ(html.find("Next</a>"), std::string::npos);
}

TEST(PageRendererTest, HomepageListsThreadsAndPages) {
    std::vector<board::Thread> threads;
    for (int i = 1; i <= 15; ++i) {
        board::Thread t;
        t.id = i;
        t.title = "Title <" + std::to_string(i) + ">";
        t.message = "msg";
        t.last_updated = i;
        threads.push_back(t);
    }

    PageRenderer renderer;
    auto html = renderer.render_homepage(board::paginate(threads, 1));

    EXPECT_NE(html.find("Title &lt;15&gt;"), std::string::npos);
    EXPECT_EQ(html.find("Title <15>"), std::string::npos);
    EXPECT_NE(html.find("href=\"/thread/15\""), std::string::npos);
    EXPECT_NE(html.find("<span class=\"current\">1</span>"), std::string::npos);
    EXPECT_NE(html.find("<a href=\"/?page=2\">Next</a>"), std::string::npos);
    EXPECT_EQ(html.find("Previous"), std::string::npos);
}

TEST(PageRendererTest, ThreadPageWithMediaAndReplies) {
    board::Thread thread;
    thread.id = 7;
    thread.title = "Cats";
    thread.message = "Look at this";
    thread.media_url = "/uploads/videos/abc.mp4";
    thread.media_kind = board::MediaKind::Video;

    std::vector<board::Reply> replies{{1, "nice"}, {2, "<b>bold</b>"}};

    PageRenderer renderer;
    auto html = renderer.render_thread_page(thread, replies);

    EXPECT_NE(html.find("name=\"parent_id\" value=\"7\""), std::string::npos);
    EXPECT_NE(html.find("<video"), std::string::npos);
    EXPECT_NE(html.find(escape_html("/uploads/videos/abc.mp4")), std::string::npos);
    EXPECT_NE(html.find("Reply 2"), std::string::npos);
    EXPECT_NE(html.find("&lt;b&gt;bold&lt;&#x2F;b&gt;"), std::string::npos);
    EXPECT_EQ(html.find("No replies yet"), std::string::npos);
}

TEST(PageRendererTest, ThreadPageWithoutReplies) {
    board::Thread thread;
    thread.id = 1;
    thread.title = "t";
    thread.message = "m";
    thread.media_url = "/thumbs/images/thumb_x.png";
    thread.media_kind = board::MediaKind::Image;

    PageRenderer renderer;
    auto html = renderer.render_thread_page(thread, {});

    EXPECT_NE(html.find("No replies yet"), std::string::npos);
    EXPECT_NE(html.find("<img"), std::string::npos);
}

TEST(PageRendererTest, ErrorPage) {
    PageRenderer renderer;
    auto html = renderer.render_error_page("Not Found", "No <such> thread");

    EXPECT_NE(html.find("<h1>Not Found</h1>"), std::string::npos);
    EXPECT_NE(html.find("No &lt;such&gt; thread"), std::string::npos);
    EXPECT_NE(html.find("href=\"/\""), std::string::npos);
}

// ============================================================================
// Submission and server
// ============================================================================

class GatewayTest : public ::testing::Test {
protected:
    std::string test_dir = "./test_gateway_data";
    std::shared_ptr<storage::KvStore> store;
    std::shared_ptr<board::ContentRepository> repository;
    std::shared_ptr<media::MediaIngestionPipeline> pipeline;

    void SetUp() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        store = std::make_shared<storage::KvStore>(test_dir + "/db");
        repository = std::make_shared<board::ContentRepository>(store);

        media::MediaPaths paths;
        paths.image_upload_dir = test_dir + "/uploads/images";
        paths.video_upload_dir = test_dir + "/uploads/videos";
        paths.image_thumb_dir = test_dir + "/thumbs/images";
        pipeline = std::make_shared<media::MediaIngestionPipeline>(paths);
    }

    void TearDown() override {
        pipeline.reset();
        repository.reset();
        store.reset();
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    BoardServerConfig server_config() const {
        BoardServerConfig config;
        config.bind_address = "127.0.0.1";
        config.http_port = 0;
        config.worker_threads = 2;
        config.static_dir = test_dir;
        return config;
    }

    std::string png_bytes(uint32_t width, uint32_t height) {
        media::Image image;
        image.width = width;
        image.height = height;
        image.pixels.assign(image.stride() * height, 0x80);
        fs::path path = fs::path(test_dir) / "fixture.png";
        EXPECT_TRUE(media::ImageCodec::encode_file(image, media::ImageFormat::Png, path).is_ok());
        std::ifstream in(path, std::ios::binary);
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        fs::remove(path);
        return data;
    }

    size_t uploaded_files() const {
        size_t count = 0;
        for (const auto& dir : {pipeline->paths().image_upload_dir,
                                pipeline->paths().video_upload_dir,
                                pipeline->paths().image_thumb_dir}) {
            count += static_cast<size_t>(std::distance(fs::directory_iterator(dir),
                                                       fs::directory_iterator()));
        }
        return count;
    }

    static void send_part(ThreadSubmission& submission, const std::string& name,
                          const std::string& filename, const std::string& data) {
        ASSERT_TRUE(submission.on_part(name, filename));
        // Two halves to exercise chunked delivery
        const size_t half = data.size() / 2;
        ASSERT_TRUE(submission.on_data(data.data(), half));
        ASSERT_TRUE(submission.on_data(data.data() + half, data.size() - half));
    }
};

TEST_F(GatewayTest, SubmissionWithImage) {
    ThreadSubmission submission(*repository, *pipeline);
    send_part(submission, "title", "", "Hello");
    send_part(submission, "message", "", "World");
    send_part(submission, "media", "pic.png", png_bytes(320, 240));

    auto thread = submission.finish();
    ASSERT_TRUE(thread.is_ok()) << thread.error().to_string();
    EXPECT_EQ(thread.value().title, "Hello");
    ASSERT_TRUE(thread.value().media_url.has_value());
    EXPECT_EQ(thread.value().media_url->rfind("/thumbs/images/thumb_", 0), 0u);
    EXPECT_EQ(uploaded_files(), 2u);
}

TEST_F(GatewayTest, SubmissionMediaBeforeText) {
    ThreadSubmission submission(*repository, *pipeline);
    send_part(submission, "media", "clip.mp4", std::string(100, 'v'));
    send_part(submission, "title", "", "Video");
    send_part(submission, "message", "", "first");

    auto thread = submission.finish();
    ASSERT_TRUE(thread.is_ok());
    ASSERT_TRUE(thread.value().media_kind.has_value());
    EXPECT_EQ(*thread.value().media_kind, board::MediaKind::Video);
}

TEST_F(GatewayTest, SubmissionWithEmptyFileField) {
    ThreadSubmission submission(*repository, *pipeline);
    send_part(submission, "title", "", "No file");
    send_part(submission, "message", "", "text only");
    ASSERT_TRUE(submission.on_part("media", ""));

    auto thread = submission.finish();
    ASSERT_TRUE(thread.is_ok());
    EXPECT_FALSE(thread.value().media_url.has_value());
}

TEST_F(GatewayTest, InvalidTextDiscardsUpload) {
    {
        ThreadSubmission submission(*repository, *pipeline);
        send_part(submission, "media", "pic.png", png_bytes(64, 64));
        send_part(submission, "title", "", "   ");
        send_part(submission, "message", "", "body");

        auto thread = submission.finish();
        ASSERT_TRUE(thread.is_err());
        EXPECT_EQ(thread.error().code(), ErrorCode::ValidationFailed);
    }
    EXPECT_EQ(uploaded_files(), 0u);
    EXPECT_EQ(repository->thread_count().value(), 0u);
}

TEST_F(GatewayTest, UnsupportedMediaStopsReading) {
    ThreadSubmission submission(*repository, *pipeline);
    send_part(submission, "title", "", "t");
    EXPECT_FALSE(submission.on_part("media", "doc.pdf"));
    EXPECT_FALSE(submission.on_data("x", 1));

    auto thread = submission.finish();
    ASSERT_TRUE(thread.is_err());
    EXPECT_EQ(thread.error().code(), ErrorCode::UnsupportedMediaType);
    EXPECT_EQ(repository->thread_count().value(), 0u);
}

TEST_F(GatewayTest, InterruptedBodyStoresNothing) {
    {
        ThreadSubmission submission(*repository, *pipeline);
        send_part(submission, "title", "", "t");
        send_part(submission, "message", "", "m");
        ASSERT_TRUE(submission.on_part("media", "clip.mp4"));
        ASSERT_TRUE(submission.on_data("partial", 7));

        auto thread = submission.finish(false);
        ASSERT_TRUE(thread.is_err());
    }
    EXPECT_EQ(uploaded_files(), 0u);
    EXPECT_EQ(repository->thread_count().value(), 0u);
}

TEST_F(GatewayTest, HomeHandlerRendersThreads) {
    repository->create_thread("First thread", "body").unwrap();
    BoardServer server(server_config(), repository, pipeline);

    auto response = server.handle_home("");
    EXPECT_EQ(response.status, HttpStatus::OK);
    EXPECT_NE(response.body.find("First thread"), std::string::npos);

    auto garbage_page = server.handle_home("not-a-number");
    EXPECT_EQ(garbage_page.status, HttpStatus::OK);
}

TEST_F(GatewayTest, ThreadHandler) {
    auto thread = repository->create_thread("Visible", "body").unwrap();
    repository->create_reply(thread.id, "a reply").unwrap();
    BoardServer server(server_config(), repository, pipeline);

    auto found = server.handle_thread(std::to_string(thread.id));
    EXPECT_EQ(found.status, HttpStatus::OK);
    EXPECT_NE(found.body.find("Visible"), std::string::npos);
    EXPECT_NE(found.body.find("a reply"), std::string::npos);

    EXPECT_EQ(server.handle_thread("999").status, HttpStatus::NOT_FOUND);
    EXPECT_EQ(server.handle_thread("abc").status, HttpStatus::NOT_FOUND);
}

TEST_F(GatewayTest, ReplyHandler) {
    auto thread = repository->create_thread("t", "m").unwrap();
    BoardServer server(server_config(), repository, pipeline);

    auto ok = server.handle_reply(std::to_string(thread.id), "hi");
    EXPECT_EQ(ok.status, HttpStatus::SEE_OTHER);
    EXPECT_EQ(ok.headers["Location"], "/thread/" + std::to_string(thread.id));

    EXPECT_EQ(server.handle_reply(std::to_string(thread.id), "  ").status, HttpStatus::BAD_REQUEST);
    EXPECT_EQ(server.handle_reply("12abc", "hi").status, HttpStatus::BAD_REQUEST);
    EXPECT_EQ(server.handle_reply("", "hi").status, HttpStatus::BAD_REQUEST);
    EXPECT_EQ(server.handle_reply("404", "hi").status, HttpStatus::NOT_FOUND);

    EXPECT_EQ(repository->list_replies(thread.id).unwrap().size(), 1u);
}

TEST_F(GatewayTest, SubmissionResponses) {
    BoardServer server(server_config(), repository, pipeline);

    board::Thread thread;
    auto created = server.respond_to_submission(Result<board::Thread>::Ok(thread));
    EXPECT_EQ(created.status, HttpStatus::SEE_OTHER);
    EXPECT_EQ(created.headers["Location"], "/");

    auto invalid = server.respond_to_submission(
        Error(ErrorCode::InvalidMedia, "Not a valid png image"));
    EXPECT_EQ(invalid.status, HttpStatus::BAD_REQUEST);
    EXPECT_NE(invalid.body.find("Not a valid png image"), std::string::npos);

    auto too_large = server.respond_to_submission(
        Error(ErrorCode::PayloadTooLarge, "Upload exceeds 1024 bytes"));
    EXPECT_EQ(too_large.status, HttpStatus::PAYLOAD_TOO_LARGE);
    EXPECT_NE(too_large.body.find("Upload exceeds 1024 bytes"), std::string::npos);

    auto internal = server.respond_to_submission(
        Error(ErrorCode::StoreWriteFailed, "secret detail"));
    EXPECT_EQ(internal.status, HttpStatus::INTERNAL_ERROR);
    EXPECT_EQ(internal.body.find("secret detail"), std::string::npos);
}

TEST_F(GatewayTest, EndToEndOverHttp) {
    BoardServer server(server_config(), repository, pipeline);
    ASSERT_TRUE(server.start());
    ASSERT_GT(server.port(), 0);

    httplib::Client client("127.0.0.1", server.port());

    httplib::MultipartFormDataItems items = {
        {"title", "Over the wire", "", ""},
        {"message", "posted with a client", "", ""},
        {"media", png_bytes(250, 250), "wire.png", "image/png"},
    };
    auto posted = client.Post("/thread", items);
    ASSERT_TRUE(posted);
    EXPECT_EQ(posted->status, 303);
    EXPECT_EQ(posted->get_header_value("Location"), "/");

    auto home = client.Get("/");
    ASSERT_TRUE(home);
    EXPECT_EQ(home->status, 200);
    EXPECT_NE(home->body.find("Over the wire"), std::string::npos);

    auto threads = repository->list_threads().unwrap();
    ASSERT_EQ(threads.size(), 1u);
    ASSERT_TRUE(threads[0].media_url.has_value());

    // The thumbnail is served from its mount
    auto thumb = client.Get(threads[0].media_url->c_str());
    ASSERT_TRUE(thumb);
    EXPECT_EQ(thumb->status, 200);

    httplib::Params reply_form{{"parent_id", "1"}, {"message", "wire reply"}};
    auto replied = client.Post("/reply", reply_form);
    ASSERT_TRUE(replied);
    EXPECT_EQ(replied->status, 303);
    EXPECT_EQ(replied->get_header_value("Location"), "/thread/1");

    auto missing = client.Get("/thread/77");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    auto bad_media = client.Post("/thread", httplib::MultipartFormDataItems{
        {"title", "t", "", ""},
        {"message", "m", "", ""},
        {"media", "BM", "x.bmp", "image/bmp"},
    });
    ASSERT_TRUE(bad_media);
    EXPECT_EQ(bad_media->status, 400);

    server.stop();
    EXPECT_FALSE(server.is_running());
}

TEST_F(GatewayTest, HomeHandlerSurvivesHugePageNumber) {
    BoardServer server(server_config(), repository, pipeline);

    auto empty = server.handle_home("9223372036854775807");
    EXPECT_EQ(empty.status, HttpStatus::OK);
    EXPECT_EQ(empty.body.find("Previous"), std::string::npos);

    ASSERT_TRUE(repository->create_thread("only", "thread").is_ok());
    auto single = server.handle_home("9223372036854775807");
    EXPECT_EQ(single.status, HttpStatus::OK);
    EXPECT_NE(single.body.find("only"), std::string::npos);
}

TEST_F(GatewayTest, OversizedUploadOverHttp) {
    auto small_pipeline = std::make_shared<media::MediaIngestionPipeline>(pipeline->paths(), 16);
    BoardServer server(server_config(), repository, small_pipeline);
    ASSERT_TRUE(server.start());

    httplib::Client client("127.0.0.1", server.port());
    auto posted = client.Post("/thread", httplib::MultipartFormDataItems{
        {"title", "big", "", ""},
        {"message", "too much", "", ""},
        {"media", png_bytes(64, 64), "big.png", "image/png"},
    });
    ASSERT_TRUE(posted);
    EXPECT_EQ(posted->status, 413);
    EXPECT_EQ(repository->thread_count().value(), 0u);
    EXPECT_EQ(uploaded_files(), 0u);

    server.stop();
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    tinyboard::utils::Logger::init("warn");
    return RUN_ALL_TESTS();
}
