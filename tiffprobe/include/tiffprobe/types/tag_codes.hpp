#pragma once

#include <cstdint>

namespace tiffprobe {

/// Well-known TIFF tag codes recognized by the registry.
/// Any code outside of this set is reported as UnknownTag.
enum class TagCode : uint16_t {
    // Baseline TIFF tags
    NewSubfileType            = 254,
    SubfileType               = 255,
    ImageWidth                = 256,
    ImageLength               = 257,
    BitsPerSample             = 258,
    Compression               = 259,
    PhotometricInterpretation = 262,
    Threshholding             = 263,
    CellWidth                 = 264,
    CellLength                = 265,
    FillOrder                 = 266,
    ImageDescription          = 270,
    Make                      = 271,
    Model                     = 272,
    StripOffsets              = 273,
    Orientation               = 274,
    SamplesPerPixel           = 277,
    RowsPerStrip              = 278,
    StripByteCounts           = 279,
    MinSampleValue            = 280,
    MaxSampleValue            = 281,
    XResolution               = 282,
    YResolution               = 283,
    PlanarConfiguration       = 284,
    FreeOffsets               = 288,
    FreeByteCounts            = 289,
    GrayResponseUnit          = 290,
    GrayResponseCurve         = 291,
    ResolutionUnit            = 296,
    Software                  = 305,
    DateTime                  = 306,
    Artist                    = 315,
    HostComputer              = 316,
    Predictor                 = 317,
    ColorMap                  = 320,
    ExtraSamples              = 338,
    SampleFormat              = 339,
    Copyright                 = 33432,

    // Section 20: Colorimetry
    TransferFunction          = 301,
    WhitePoint                = 318,
    PrimaryChromaticities     = 319,
    TransferRange             = 342,
    ReferenceBlackWhite       = 532,

    // Section 21: YCbCr images
    YCbCrCoefficients         = 529,
    YCbCrSubSampling          = 530,
    YCbCrPositioning          = 531,

    // TIFF/EP tags
    SubIFD                    = 330,
    JPEGTables                = 347,
    CFARepeatPatternDim       = 33421,
    BatteryLevel              = 33423,
    RichTIFFIPTC              = 33723,
    ICCProfile                = 34675,
    Interlace                 = 34857,
    TimeZoneOffset            = 34858,
    SelfTimerMode             = 34859,
    Noise                     = 37389,
    ImageNumber               = 37393,
    SecurityClassification    = 37394,
    ImageHistory              = 37395,
    TIFFEPStandardID          = 37398,

    // Extension and private tags
    XMLPacket                 = 700,
    Photoshop                 = 34377,
    EXIFIFDOffset             = 34665,
};

/// @brief Compression (tag 259)
enum class CompressionScheme : uint16_t {
    None          = 1,     ///< No compression
    CCITT_RLE     = 2,     ///< CCITT modified Huffman RLE
    CCITT_Fax3    = 3,     ///< CCITT Group 3 fax
    CCITT_Fax4    = 4,     ///< CCITT Group 4 fax
    LZW           = 5,     ///< Lempel-Ziv-Welch
    JPEG_Old      = 6,     ///< Old-style JPEG
    JPEG          = 7,     ///< JPEG
    Deflate_Adobe = 8,     ///< Adobe-style Deflate
    PackBits      = 32773, ///< PackBits run length
    Deflate       = 32946, ///< PKZIP-style Deflate
};

/// @brief Photometric interpretation (tag 262)
enum class PhotometricInterpretation : uint16_t {
    MinIsWhite = 0,
    MinIsBlack = 1,
    RGB        = 2,
    Palette    = 3,
    Mask       = 4,
    CMYK       = 5,
    YCbCr      = 6,
    CIELab     = 8,
};

/// @brief Planar configuration (tag 284)
enum class PlanarConfiguration : uint16_t {
    Chunky = 1, ///< Samples of a pixel stored together
    Planar = 2, ///< Each sample stored in its own plane
};

/// @brief Resolution unit (tag 296)
enum class ResolutionUnit : uint16_t {
    None       = 1,
    Inch       = 2,
    Centimeter = 3,
};

/// @brief Sample format (tag 339)
enum class SampleFormat : uint16_t {
    UnsignedInt = 1,
    SignedInt   = 2,
    IEEEFloat   = 3,
    Undefined   = 4,
};

} // namespace tiffprobe
