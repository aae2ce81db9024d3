#include "mdoc/pdf_writer.h"
#include "mdoc/platform.h"
#include "mdoc/log.h"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <zlib.h>

namespace mdoc {

int PdfWriter::reserveObject() {
    objects_.emplace_back();
    assigned_.push_back(false);
    return static_cast<int>(objects_.size());
}

void PdfWriter::setObject(int id, std::string body) {
    if (id < 1 || id > static_cast<int>(objects_.size())) {
        throw std::out_of_range("PDF object " + std::to_string(id) + " was never reserved");
    }
    objects_[id - 1] = std::move(body);
    assigned_[id - 1] = true;
}

int PdfWriter::addObject(std::string body) {
    int id = reserveObject();
    setObject(id, std::move(body));
    return id;
}

int PdfWriter::addStream(const std::string& data, bool compress, const std::string& dictExtra) {
    std::string payload = data;
    bool compressed = false;
    // An empty stream stays unfiltered; zero bytes are not a zlib stream
    if (compress && !data.empty()) {
        std::string deflated;
        if (deflate(data, deflated)) {
            payload.swap(deflated);
            compressed = true;
        } else {
            MDOC_LOGW("PdfWriter: compression failed, writing %zu bytes uncompressed", data.size());
        }
    }

    std::ostringstream body;
    body << "<< /Length " << payload.size();
    if (compressed) body << " /Filter /FlateDecode";
    if (!dictExtra.empty()) body << ' ' << dictExtra;
    body << " >>\nstream\n" << payload << "\nendstream";
    return addObject(body.str());
}

std::string PdfWriter::finish(int catalogId, int infoId) const {
    for (size_t i = 0; i < assigned_.size(); ++i) {
        if (!assigned_[i]) {
            throw std::logic_error("PDF object " + std::to_string(i + 1) +
                                   " reserved but never written");
        }
    }

    std::ostringstream file;
    // Binary marker line so transfer tools treat the file as binary
    file << "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<long> offsets;
    offsets.reserve(objects_.size());
    for (size_t i = 0; i < objects_.size(); ++i) {
        offsets.push_back(static_cast<long>(file.tellp()));
        file << (i + 1) << " 0 obj\n" << objects_[i] << "\nendobj\n";
    }

    long xrefPos = static_cast<long>(file.tellp());
    file << "xref\n0 " << (objects_.size() + 1)
         << "\n0000000000 65535 f \n";
    for (long off : offsets) {
        file << std::setw(10) << std::setfill('0') << off << " 00000 n \n";
    }
    file << "trailer\n<< /Size " << (objects_.size() + 1)
         << " /Root " << catalogId << " 0 R";
    if (infoId > 0) file << " /Info " << infoId << " 0 R";
    file << " >>\nstartxref\n" << xrefPos << "\n%%EOF\n";
    return file.str();
}

std::string PdfWriter::escapeString(const std::string& bytes) {
    std::string escaped;
    escaped.reserve(bytes.size());
    for (unsigned char ch : bytes) {
        switch (ch) {
            case '(':
            case ')':
            case '\\':
                escaped.push_back('\\');
                escaped.push_back(static_cast<char>(ch));
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20 || ch > 0x7E) {
                    char oct[5];
                    std::snprintf(oct, sizeof(oct), "\\%03o", ch);
                    escaped.append(oct);
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    return escaped;
}

std::string PdfWriter::textString(const std::string& utf8) {
    return "(" + escapeString(utf8ToWinAnsi(utf8)) + ")";
}

std::string PdfWriter::formatNumber(double value) {
    if (!std::isfinite(value)) return "0";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << value;
    std::string s = ss.str();
    // Trim trailing zeros and a dangling decimal point
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

bool PdfWriter::deflate(const std::string& input, std::string& output) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::string compressed;
    compressed.resize(bound);

    int zres = compress2(reinterpret_cast<Bytef*>(&compressed[0]), &bound,
                         reinterpret_cast<const Bytef*>(input.data()),
                         static_cast<uLong>(input.size()), Z_BEST_SPEED);
    if (zres != Z_OK) {
        MDOC_LOGW("PdfWriter: compress2 failed with code %d", zres);
        return false;
    }

    compressed.resize(bound);
    output.swap(compressed);
    return true;
}

} // namespace mdoc
