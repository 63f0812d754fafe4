#include "frame_export.hpp"
#include "compositor.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>

bool encodeFrame(const RenderOutput& frame, EncodedFormat format, std::vector<unsigned char>& outBytes, int jpegQuality)
{
    outBytes.clear();
    if (frame.placeholder || frame.bitmap.empty())
    {
        std::cerr << "[encodeFrame] no rendered image to export\n";
        return false;
    }
    try
    {
        if (format == EncodedFormat::Jpeg)
        {
            const cv::Mat flat = util::flattenOnto(frame.bitmap, cv::Scalar(255, 255, 255));
            const std::vector<int> opts { cv::IMWRITE_JPEG_QUALITY, std::clamp(jpegQuality, 1, 100) };
            return cv::imencode(".jpg", flat, outBytes, opts);
        }
        return cv::imencode(".png", frame.bitmap, outBytes);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[encodeFrame] " << e.what() << "\n";
        outBytes.clear();
        return false;
    }
}

std::string makeExportPath(const std::string& inPath, EncodedFormat format)
{
    const std::filesystem::path p(inPath);
    const char* ext = (format == EncodedFormat::Jpeg) ? ".jpg" : ".png";
    return (p.parent_path() / (p.stem().string() + "_torn" + ext)).string();
}

bool writeFrame(const RenderOutput& frame, const std::string& outPath, EncodedFormat format)
{
    if (frame.placeholder || frame.bitmap.empty())
    {
        std::cerr << "[writeFrame] no rendered image to export\n";
        return false;
    }
    try
    {
        if (format == EncodedFormat::Jpeg)
        {
            const std::vector<int> opts { cv::IMWRITE_JPEG_QUALITY, kDefaultJpegQuality };
            if (cv::imwrite(outPath, util::flattenOnto(frame.bitmap, cv::Scalar(255, 255, 255)), opts)) return true;
        }
        else if (cv::imwrite(outPath, frame.bitmap)) return true;
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[writeFrame] " << e.what() << "\n";
        return false;
    }
    std::cerr << "[writeFrame] cannot write: " << outPath << "\n";
    return false;
}
