#include <quarry/extraction/text_utils.h>

#include <algorithm>
#include <cctype>

namespace quarry::extraction {

std::string EncodingDetector::detectEncoding(std::span<const std::byte> data, double* confidence) {
    if (data.size() >= 3) {
        if (static_cast<uint8_t>(data[0]) == 0xEF && static_cast<uint8_t>(data[1]) == 0xBB &&
            static_cast<uint8_t>(data[2]) == 0xBF) {
            if (confidence)
                *confidence = 1.0;
            return "UTF-8";
        }
    }

    if (data.size() >= 2) {
        if (static_cast<uint8_t>(data[0]) == 0xFF && static_cast<uint8_t>(data[1]) == 0xFE) {
            if (confidence)
                *confidence = 1.0;
            return "UTF-16LE";
        }
        if (static_cast<uint8_t>(data[0]) == 0xFE && static_cast<uint8_t>(data[1]) == 0xFF) {
            if (confidence)
                *confidence = 1.0;
            return "UTF-16BE";
        }
    }

    bool isValidUtf8 = true;
    size_t i = 0;
    while (i < data.size() && isValidUtf8) {
        auto byte = static_cast<uint8_t>(data[i]);
        size_t len = 0;
        if (byte <= 0x7F) {
            len = 1;
        } else if ((byte & 0xE0) == 0xC0) {
            len = 2;
        } else if ((byte & 0xF0) == 0xE0) {
            len = 3;
        } else if ((byte & 0xF8) == 0xF0) {
            len = 4;
        } else {
            isValidUtf8 = false;
            break;
        }
        if (i + len > data.size()) {
            isValidUtf8 = false;
            break;
        }
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<uint8_t>(data[i + k]) & 0xC0) != 0x80) {
                isValidUtf8 = false;
                break;
            }
        }
        i += len;
    }

    if (isValidUtf8) {
        if (confidence)
            *confidence = 0.9;
        return "UTF-8";
    }

    if (confidence)
        *confidence = 0.5;
    return "ISO-8859-1";
}

void appendUtf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        appendUtf8(0xFFFD, out);
    }
}

Result<std::string> EncodingDetector::convertToUtf8(std::string_view text,
                                                    const std::string& fromEncoding) {
    if (fromEncoding == "UTF-8" || fromEncoding == "utf-8" || fromEncoding == "ASCII") {
        return std::string(text);
    }

    const auto byteAt = [&](size_t i) { return static_cast<uint8_t>(text[i]); };

    if (fromEncoding == "ISO-8859-1" || fromEncoding == "iso-8859-1" || fromEncoding == "latin1") {
        std::string out;
        out.reserve(text.size() + text.size() / 4);
        for (unsigned char b : text) {
            appendUtf8(static_cast<uint32_t>(b), out);
        }
        return out;
    }

    if (fromEncoding == "UTF-16LE" || fromEncoding == "UTF-16BE") {
        const bool le = (fromEncoding == "UTF-16LE");
        auto unitAt = [&](size_t i) -> uint16_t {
            return le ? static_cast<uint16_t>(byteAt(i + 1) << 8 | byteAt(i))
                      : static_cast<uint16_t>(byteAt(i) << 8 | byteAt(i + 1));
        };
        size_t i = 0;
        if (text.size() >= 2 && unitAt(0) == 0xFEFF) {
            i = 2;
        }
        std::string out;
        out.reserve(text.size());
        while (i + 1 < text.size()) {
            uint16_t w = unitAt(i);
            i += 2;
            if (w >= 0xD800 && w <= 0xDBFF) {
                if (i + 1 >= text.size()) {
                    appendUtf8(0xFFFD, out);
                    break;
                }
                uint16_t w2 = unitAt(i);
                if (w2 < 0xDC00 || w2 > 0xDFFF) {
                    appendUtf8(0xFFFD, out);
                    continue;
                }
                i += 2;
                uint32_t cp = 0x10000 + (((w - 0xD800u) << 10) | (w2 - 0xDC00u));
                appendUtf8(cp, out);
            } else if (w >= 0xDC00 && w <= 0xDFFF) {
                appendUtf8(0xFFFD, out);
            } else {
                appendUtf8(w, out);
            }
        }
        return out;
    }

    return Error{ErrorCode::UnsupportedFormat, "Unsupported encoding conversion: " + fromEncoding};
}

Result<DecodedText> decodeText(std::span<const std::byte> data) {
    DecodedText decoded;
    decoded.encoding = EncodingDetector::detectEncoding(data, &decoded.confidence);
    auto converted = EncodingDetector::convertToUtf8(asStringView(data), decoded.encoding);
    if (!converted) {
        return converted.error();
    }
    decoded.text = std::move(converted).value();
    if (decoded.text.starts_with("\xEF\xBB\xBF")) {
        decoded.text.erase(0, 3);
    }
    return decoded;
}

std::string renderMarkdownTable(const std::vector<std::vector<std::string>>& rows) {
    if (rows.empty()) {
        return {};
    }
    size_t columns = 0;
    for (const auto& row : rows) {
        columns = std::max(columns, row.size());
    }
    if (columns == 0) {
        return {};
    }

    auto escapeCell = [](const std::string& cell) {
        std::string out;
        out.reserve(cell.size());
        for (char c : cell) {
            if (c == '|') {
                out += "\\|";
            } else if (c == '\n' || c == '\r') {
                out.push_back(' ');
            } else {
                out.push_back(c);
            }
        }
        return out;
    };

    std::string md;
    auto appendRow = [&](const std::vector<std::string>& row) {
        md += "|";
        for (size_t c = 0; c < columns; ++c) {
            md += " ";
            if (c < row.size()) {
                md += escapeCell(row[c]);
            }
            md += " |";
        }
        md += "\n";
    };

    appendRow(rows.front());
    md += "|";
    for (size_t c = 0; c < columns; ++c) {
        md += " --- |";
    }
    md += "\n";
    for (size_t r = 1; r < rows.size(); ++r) {
        appendRow(rows[r]);
    }
    return md;
}

std::string normalizeWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::string line;
    int blankRun = 0;

    auto flushLine = [&]() {
        while (!line.empty() && line.back() == ' ') {
            line.pop_back();
        }
        if (line.empty()) {
            ++blankRun;
            if (blankRun == 1 && !out.empty()) {
                out.push_back('\n');
            }
        } else {
            blankRun = 0;
            out += line;
            out.push_back('\n');
        }
        line.clear();
    };

    for (char c : text) {
        if (c == '\n') {
            flushLine();
        } else if (c == '\r') {
            continue;
        } else if (c == ' ' || c == '\t' || c == '\f' || c == '\v') {
            if (!line.empty() && line.back() != ' ') {
                line.push_back(' ');
            }
        } else {
            line.push_back(c);
        }
    }
    if (!line.empty()) {
        flushLine();
    }
    while (!out.empty() && (out.back() == '\n')) {
        out.pop_back();
    }
    return out;
}

std::string formatPageMarker(std::string_view format, size_t pageNumber) {
    constexpr std::string_view kPlaceholder = "{page_num}";
    const auto number = std::to_string(pageNumber);
    std::string out;
    out.reserve(format.size() + 8);
    size_t pos = 0;
    while (pos < format.size()) {
        auto hit = format.find(kPlaceholder, pos);
        if (hit == std::string_view::npos) {
            out.append(format.substr(pos));
            break;
        }
        out.append(format.substr(pos, hit - pos));
        out += number;
        pos = hit + kPlaceholder.size();
    }
    return out;
}

} // namespace quarry::extraction
