/*========================  source_image.hpp  ========================

   Decoded photo handed to the render session.
   --------------------------------------------------------------------
   • decoding happens before the pipeline runs; a failure is recorded as
     SourceState::DecodeFailed and rendered as a placeholder, never thrown
   • the upload's encoding is remembered so exports can match it

=====================================================================*/
#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "models/EncodedFormat.hpp"

enum class SourceState
{
    Empty = 0,
    Ready = 1,
    DecodeFailed = 2,
};

struct SourceImage
{
    SourceState state {SourceState::Empty};
    cv::Mat bitmap;                       // 8-bit BGR or BGRA
    EncodedFormat format {EncodedFormat::Png};
    std::string name;

    bool ready() const { return state == SourceState::Ready && !bitmap.empty(); }
};

// PNG when the buffer carries the PNG signature, JPEG otherwise
EncodedFormat sniffFormat(const std::vector<uchar>& bytes);

// Format implied by a file extension; falls back to PNG
EncodedFormat formatFromExtension(const std::string& path);

// Decode an in-memory upload; returns a DecodeFailed image on bad data
SourceImage decodeSourceImage(const std::vector<uchar>& bytes, const std::string& name = std::string());

// Read a file from disk with imread (front ends only; the pipeline never touches files)
SourceImage loadSourceImage(const std::string& path);

// Wrap an already decoded bitmap; an empty bitmap yields an Empty source
SourceImage sourceFromBitmap(const cv::Mat& bitmap, EncodedFormat format = EncodedFormat::Png,
                             const std::string& name = std::string());
