#include "source_image.hpp"
#include "util/ImageOps.hpp"
#include <algorithm>
#include <filesystem>
#include <cctype>
#include <iostream>
#include <iterator>

namespace
{
    // 8-bit BGR, or 8-bit BGRA when the upload carries alpha
    cv::Mat normalizeBitmap(const cv::Mat& img)
    {
        if (img.channels() != 4) return util::toBgr8(img);
        if (img.depth() == CV_8U) return img;
        cv::Mat out;
        const double scale = (img.depth() == CV_16U) ? 1.0 / 257.0 : 255.0;
        img.convertTo(out, CV_8UC4, scale);
        return out;
    }
}

EncodedFormat sniffFormat(const std::vector<uchar>& bytes)
{
    static const uchar kPngSig[] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    if (bytes.size() >= sizeof(kPngSig) && std::equal(std::begin(kPngSig), std::end(kPngSig), bytes.begin()))
        return EncodedFormat::Png;
    return EncodedFormat::Jpeg;
}

EncodedFormat formatFromExtension(const std::string& path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return (ext == ".jpg" || ext == ".jpeg") ? EncodedFormat::Jpeg : EncodedFormat::Png;
}

SourceImage decodeSourceImage(const std::vector<uchar>& bytes, const std::string& name)
{
    SourceImage src;
    src.name = name;
    src.state = SourceState::DecodeFailed;
    if (bytes.empty()) { std::cerr << "[decodeSourceImage] empty buffer for '" << name << "'\n"; return src; }

    src.format = sniffFormat(bytes);
    cv::Mat img;
    try
    {
        img = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[decodeSourceImage] " << e.what() << "\n";
        return src;
    }
    if (img.empty()) { std::cerr << "[decodeSourceImage] cannot decode '" << name << "'\n"; return src; }

    src.bitmap = normalizeBitmap(img);
    src.state = SourceState::Ready;
    return src;
}

SourceImage loadSourceImage(const std::string& path)
{
    SourceImage src;
    src.name = std::filesystem::path(path).filename().string();
    src.state = SourceState::DecodeFailed;

    src.format = formatFromExtension(path);

    cv::Mat img;
    try
    {
        img = cv::imread(path, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[loadSourceImage] " << e.what() << "\n";
        return src;
    }
    if (img.empty()) { std::cerr << "[loadSourceImage] cannot read: " << path << "\n"; return src; }

    src.bitmap = normalizeBitmap(img);
    src.state = SourceState::Ready;
    return src;
}

SourceImage sourceFromBitmap(const cv::Mat& bitmap, EncodedFormat format, const std::string& name)
{
    SourceImage src;
    src.format = format;
    src.name = name;
    if (bitmap.empty()) return src;
    src.bitmap = normalizeBitmap(bitmap);
    src.state = SourceState::Ready;
    return src;
}
