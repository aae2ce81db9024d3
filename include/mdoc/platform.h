#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace mdoc {

/// Font weight values matching CSS font-weight
enum class FontWeight : uint16_t {
    Regular    = 400,
    Bold       = 700,
};

/// Font style
enum class FontStyle {
    Normal,
    Italic,
};

/// Font descriptor for requesting a specific font
struct FontDescriptor {
    std::string family = "Helvetica";
    float size = 10.5f;
    FontWeight weight = FontWeight::Regular;
    FontStyle style = FontStyle::Normal;

    bool operator==(const FontDescriptor& o) const {
        return family == o.family && size == o.size &&
               weight == o.weight && style == o.style;
    }
    bool operator!=(const FontDescriptor& o) const { return !(*this == o); }
};

/// Metrics for a resolved font
struct FontMetrics {
    float ascent = 0;       // Distance from baseline to top
    float descent = 0;      // Distance from baseline to bottom (positive)
    float leading = 0;      // Inter-line spacing recommended by font

    float lineHeight() const { return ascent + descent + leading; }
};

/// Result of measuring a text run
struct TextMeasurement {
    float width = 0;
    float height = 0;
};

/// Abstract interface for font measurement.
/// The renderer draws with the PDF base-14 fonts, so the default
/// implementation is StandardFontAdapter; tests plug in fixed-width mocks.
class PlatformAdapter {
public:
    virtual ~PlatformAdapter() = default;

    /// Resolve a font descriptor and return its metrics
    virtual FontMetrics resolveFontMetrics(const FontDescriptor& desc) = 0;

    /// Measure the width of a UTF-8 string with the given font
    virtual TextMeasurement measureText(const std::string& text,
                                        const FontDescriptor& font) = 0;

    /// Find a valid line break position within text that fits maxWidth.
    /// Returns the byte index where the break should occur (after a space when
    /// possible). If the entire text fits, returns text.size(). Returns 0 when
    /// not even the first word fits.
    virtual size_t findLineBreak(const std::string& text,
                                 const FontDescriptor& font,
                                 float maxWidth) = 0;
};

/// Metrics for the PDF standard fonts (Helvetica and Courier families).
/// Widths follow the Adobe AFM tables in WinAnsi encoding.
class StandardFontAdapter : public PlatformAdapter {
public:
    FontMetrics resolveFontMetrics(const FontDescriptor& desc) override;
    TextMeasurement measureText(const std::string& text,
                                const FontDescriptor& font) override;
    size_t findLineBreak(const std::string& text,
                         const FontDescriptor& font,
                         float maxWidth) override;
};

/// Transcode UTF-8 to single-byte WinAnsi (CP1252). Code points without a
/// WinAnsi slot become '?'.
std::string utf8ToWinAnsi(const std::string& utf8);

/// Byte length of the UTF-8 sequence introduced by lead byte c (1 for invalid)
size_t utf8CharLen(unsigned char c);

} // namespace mdoc
