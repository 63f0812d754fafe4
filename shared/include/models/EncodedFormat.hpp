/**
 * @file EncodedFormat.hpp
 * Encodings accepted on upload and produced on export.
 */
#pragma once

enum class EncodedFormat
{
    Png = 0,
    Jpeg = 1,
};
