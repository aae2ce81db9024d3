#pragma once

#include <string>
#include <vector>

namespace mdoc {

/// Minimal PDF 1.4 object collector. Objects are numbered from 1 in
/// allocation order; finish() serializes them with a cross-reference table.
class PdfWriter {
public:
    /// Allocate an object number whose body is supplied later
    int reserveObject();

    /// Set the body (dictionary, array, ...) of a reserved object
    void setObject(int id, std::string body);

    /// Allocate and set in one step
    int addObject(std::string body);

    /// Add a stream object. dictExtra goes inside the stream dictionary
    /// (without /Length and /Filter). Compresses with Flate when requested;
    /// falls back to the raw data if compression fails.
    int addStream(const std::string& data, bool compress,
                  const std::string& dictExtra = {});

    size_t objectCount() const { return objects_.size(); }

    /// Serialize the file. Throws std::logic_error if a reserved object was
    /// never set.
    std::string finish(int catalogId, int infoId = 0) const;

    /// Escape a byte string for use inside ( ) in a PDF content stream
    static std::string escapeString(const std::string& bytes);

    /// Literal string object: UTF-8 input transcoded to WinAnsi and escaped
    static std::string textString(const std::string& utf8);

    /// Fixed-point number with trailing zeros trimmed
    static std::string formatNumber(double value);

    /// Flate-compress with zlib. Returns false (output untouched) on failure.
    static bool deflate(const std::string& input, std::string& output);

private:
    std::vector<std::string> objects_;
    std::vector<bool> assigned_;
};

} // namespace mdoc
