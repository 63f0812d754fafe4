#include <catch2/catch.hpp>
#include "frame_export.hpp"
#include "compositor.hpp"
#include "render_session.hpp"
#include "source_image.hpp"
#include "util/RandomSource.hpp"
#include <filesystem>

namespace
{
    RenderOutput renderedFrame()
    {
        cv::Mat img(90, 120, CV_8UC3, cv::Scalar(40, 120, 200));
        RenderSession session(std::make_unique<util::CvRandomSource>(11));
        session.setSource(sourceFromBitmap(img));
        return session.render(StyleParameters());
    }
}

TEST_CASE("PNG export keeps the transparent margin", "[export]")
{
    const RenderOutput frame = renderedFrame();
    REQUIRE_FALSE(frame.placeholder);

    std::vector<unsigned char> bytes;
    REQUIRE(encodeFrame(frame, EncodedFormat::Png, bytes));
    REQUIRE(sniffFormat(bytes) == EncodedFormat::Png);

    const cv::Mat back = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    REQUIRE(back.size() == frame.bitmap.size());
    REQUIRE(back.channels() == 4);
    REQUIRE(back.at<cv::Vec4b>(0, 0)[3] < 255);
}

TEST_CASE("JPEG export is flattened onto white", "[export]")
{
    const RenderOutput frame = renderedFrame();
    std::vector<unsigned char> bytes;
    REQUIRE(encodeFrame(frame, EncodedFormat::Jpeg, bytes));
    REQUIRE(sniffFormat(bytes) == EncodedFormat::Jpeg);

    const cv::Mat back = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    REQUIRE(back.size() == frame.bitmap.size());
    REQUIRE(back.channels() == 3);
    REQUIRE(bytes[0] == 0xFF);
    REQUIRE(bytes[1] == 0xD8);
}

TEST_CASE("placeholder frames are not exported", "[export]")
{
    RenderOutput frame;
    renderPlaceholder(PlaceholderKind::NoImage, frame);
    std::vector<unsigned char> bytes { 1, 2, 3 };
    REQUIRE_FALSE(encodeFrame(frame, EncodedFormat::Png, bytes));
    REQUIRE(bytes.empty());

    REQUIRE_FALSE(encodeFrame(RenderOutput(), EncodedFormat::Jpeg, bytes));
}

TEST_CASE("export file naming", "[export]")
{
    REQUIRE(makeExportPath("/tmp/photo.jpeg", EncodedFormat::Jpeg) == "/tmp/photo_torn.jpg");
    REQUIRE(makeExportPath("/tmp/photo.jpeg", EncodedFormat::Png) == "/tmp/photo_torn.png");
    REQUIRE(makeExportPath("shot.png", EncodedFormat::Png) == "shot_torn.png");

    REQUIRE(formatFromExtension("a/b/IMG_01.JPG") == EncodedFormat::Jpeg);
    REQUIRE(formatFromExtension("pic.jpeg") == EncodedFormat::Jpeg);
    REQUIRE(formatFromExtension("pic.png") == EncodedFormat::Png);
    REQUIRE(formatFromExtension("noext") == EncodedFormat::Png);
}

TEST_CASE("upload decoding", "[export][source]")
{
    REQUIRE(sniffFormat({}) == EncodedFormat::Jpeg);
    REQUIRE(sniffFormat({ 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A }) == EncodedFormat::Png);

    SECTION("round trip through an encoded PNG")
    {
        cv::Mat img(20, 30, CV_8UC4, cv::Scalar(10, 20, 30, 128));
        std::vector<uchar> bytes;
        REQUIRE(cv::imencode(".png", img, bytes));
        const SourceImage src = decodeSourceImage(bytes, "x.png");
        REQUIRE(src.ready());
        REQUIRE(src.format == EncodedFormat::Png);
        REQUIRE(src.bitmap.type() == CV_8UC4);
        REQUIRE(src.name == "x.png");
    }

    SECTION("grayscale uploads become BGR")
    {
        cv::Mat gray(16, 16, CV_8U, cv::Scalar(77));
        std::vector<uchar> bytes;
        REQUIRE(cv::imencode(".jpg", gray, bytes));
        const SourceImage src = decodeSourceImage(bytes);
        REQUIRE(src.ready());
        REQUIRE(src.format == EncodedFormat::Jpeg);
        REQUIRE(src.bitmap.type() == CV_8UC3);
    }

    SECTION("empty input stays empty")
    {
        REQUIRE(decodeSourceImage({}).state == SourceState::DecodeFailed);
        REQUIRE(sourceFromBitmap(cv::Mat()).state == SourceState::Empty);
        REQUIRE(loadSourceImage("/nonexistent/dir/none.png").state == SourceState::DecodeFailed);
    }
}

TEST_CASE("frames written to disk read back as sources", "[export][source]")
{
    const RenderOutput frame = renderedFrame();
    const std::filesystem::path dir = std::filesystem::temp_directory_path();
    const std::string pngPath = makeExportPath((dir / "torn_paper_export_test.png").string(), EncodedFormat::Png);
    const std::string jpgPath = makeExportPath((dir / "torn_paper_export_test.png").string(), EncodedFormat::Jpeg);

    REQUIRE(writeFrame(frame, pngPath, EncodedFormat::Png));
    const SourceImage png = loadSourceImage(pngPath);
    REQUIRE(png.ready());
    REQUIRE(png.format == EncodedFormat::Png);
    REQUIRE(png.name == "torn_paper_export_test_torn.png");
    REQUIRE(png.bitmap.type() == CV_8UC4);
    REQUIRE(cv::norm(png.bitmap, frame.bitmap, cv::NORM_INF) == 0.0);

    REQUIRE(writeFrame(frame, jpgPath, EncodedFormat::Jpeg));
    const SourceImage jpg = loadSourceImage(jpgPath);
    REQUIRE(jpg.ready());
    REQUIRE(jpg.format == EncodedFormat::Jpeg);
    REQUIRE(jpg.bitmap.type() == CV_8UC3);
    REQUIRE(jpg.bitmap.size() == frame.bitmap.size());

    std::filesystem::remove(pngPath);
    std::filesystem::remove(jpgPath);

    RenderOutput placeholder;
    renderPlaceholder(PlaceholderKind::NoImage, placeholder);
    REQUIRE_FALSE(writeFrame(placeholder, pngPath, EncodedFormat::Png));
    REQUIRE_FALSE(std::filesystem::exists(pngPath));
}
