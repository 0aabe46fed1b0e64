#pragma once

#include <cstdint>

/**
 * \file repack_status.h
 * \brief Failure taxonomy shared by the PNG walker, IDAT merger and verifier.
 */

namespace pngrepack {

/// Outcome of a transcoding or verification pass. Every non-Ok value is fatal.
enum class RepackStatus : uint8_t {
    Ok,
    /// The 8-byte signature does not match the PNG magic.
    NotAPngFile,
    /// The first chunk is not IHDR (or the file ends after the signature).
    MissingHeader,
    /// IHDR does not carry exactly 13 payload bytes.
    BadHeaderLength,
    /// IHDR compression method is not 0 (zlib/deflate).
    UnsupportedCompressionMethod,
    /// A chunk length exceeds 2^31-1.
    ChunkTooLarge,
    /// A non-IDAT chunk failed its CRC check.
    ContainerCrcMismatch,
    /// An IDAT chunk failed its CRC check.
    ImageDataCrcMismatch,
    /// A second, non-contiguous IDAT run was found.
    WrongImageDataOrder,
    /// The IDAT zlib stream could not be decoded.
    CorruptImageStream,
    /// The source ended inside a chunk.
    Truncated,
    /// Options are out of range (e.g. an unknown compression level).
    InvalidOptions,
    /// A configured resource limit was exceeded.
    LimitExceeded,
    /// The source reported an I/O error.
    ReadFailed,
    /// The sink reported an I/O error.
    WriteFailed,
    /// zlib could not be initialized or failed internally while compressing.
    CodecFailed,
};

}  // namespace pngrepack
