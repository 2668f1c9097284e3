#include <quarry/core/mime.h>
#include <quarry/extraction/ooxml.h>
#include <quarry/extraction/text_utils.h>
#include <quarry/extraction/xlsx_extractor.h>
#include <quarry/extraction/xml_document.h>
#include <quarry/extraction/archive_reader.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>

namespace quarry::extraction {

namespace {

constexpr uint32_t kMaxRows = 1'048'576;
constexpr uint32_t kMaxColumns = 16'384;

struct SheetInfo {
    std::string name;
    std::string part;
};

struct SheetCell {
    uint32_t row;
    uint32_t col;
    std::string value;
};

std::string resolveTarget(const std::string& target) {
    if (target.starts_with("/")) {
        return target.substr(1);
    }
    if (target.starts_with("xl/")) {
        return target;
    }
    return "xl/" + target;
}

std::vector<SheetInfo> discoverSheets(const std::map<std::string, std::string>& parts) {
    std::vector<SheetInfo> sheets;
    auto wbIt = parts.find("xl/workbook.xml");
    auto relsIt = parts.find("xl/_rels/workbook.xml.rels");
    if (wbIt != parts.end() && relsIt != parts.end()) {
        auto wb = XmlDocument::parse(wbIt->second, wbIt->first);
        auto rels = XmlDocument::parse(relsIt->second, relsIt->first);
        if (wb && rels) {
            std::map<std::string, std::string> targets;
            for (auto rel : XmlDocument::children(rels.value().root(), "Relationship")) {
                targets[XmlDocument::attribute(rel, "Id")] =
                    resolveTarget(XmlDocument::attribute(rel, "Target"));
            }
            auto sheetsNode = XmlDocument::firstChild(wb.value().root(), "sheets");
            for (auto sheet : XmlDocument::children(sheetsNode, "sheet")) {
                auto it = targets.find(XmlDocument::attribute(sheet, "id"));
                if (it != targets.end() && parts.contains(it->second)) {
                    sheets.push_back({XmlDocument::attribute(sheet, "name"), it->second});
                }
            }
        }
    }
    if (sheets.empty()) {
        // Sequential fallback when the workbook relationships are unusable
        std::vector<std::pair<size_t, std::string>> found;
        for (const auto& [name, _] : parts) {
            if (name.starts_with("xl/worksheets/sheet") && name.ends_with(".xml")) {
                found.emplace_back(ooxml::partNumber(name), name);
            }
        }
        std::sort(found.begin(), found.end());
        for (const auto& [number, name] : found) {
            sheets.push_back({"Sheet" + std::to_string(number), name});
        }
    }
    return sheets;
}

std::vector<std::string> sharedStrings(const std::map<std::string, std::string>& parts) {
    std::vector<std::string> strings;
    auto it = parts.find("xl/sharedStrings.xml");
    if (it == parts.end()) {
        return strings;
    }
    auto doc = XmlDocument::parse(it->second, it->first);
    if (!doc) {
        spdlog::warn("Ignoring unreadable shared strings: {}", doc.error().message);
        return strings;
    }
    for (auto si : XmlDocument::children(doc.value().root(), "si")) {
        std::string value;
        // Rich text runs are concatenated; phonetic runs are skipped
        for (auto t : XmlDocument::descendants(si, "t")) {
            if (XmlDocument::localName(t.parent()) == "rPh") {
                continue;
            }
            value += XmlDocument::text(t);
        }
        strings.push_back(std::move(value));
    }
    return strings;
}

std::string cellValue(XmlNode c, const std::vector<std::string>& shared) {
    const auto type = XmlDocument::attribute(c, "t");
    if (type == "inlineStr") {
        std::string value;
        for (auto t : XmlDocument::descendants(XmlDocument::firstChild(c, "is"), "t")) {
            value += XmlDocument::text(t);
        }
        return value;
    }
    auto raw = XmlDocument::text(XmlDocument::firstChild(c, "v"));
    if (type == "s") {
        size_t index = 0;
        for (char ch : raw) {
            if (!std::isdigit(static_cast<unsigned char>(ch)) || index > shared.size()) {
                return {};
            }
            index = index * 10 + static_cast<size_t>(ch - '0');
        }
        return !raw.empty() && index < shared.size() ? shared[index] : std::string{};
    }
    if (type == "b") {
        return raw == "1" ? "TRUE" : "FALSE";
    }
    return raw;
}

// Collects populated cells in document order; memory follows the cells present
std::vector<SheetCell> collectCells(XmlNode sheetData, const std::vector<std::string>& shared) {
    std::vector<SheetCell> cells;
    uint32_t nextRow = 1;
    for (auto row : XmlDocument::children(sheetData, "row")) {
        uint32_t rowNumber = nextRow;
        if (auto r = XmlDocument::attribute(row, "r"); !r.empty()) {
            if (auto parsed = XlsxExtractor::parseCellReference("A" + r)) {
                rowNumber = parsed->row;
            }
        }
        uint32_t nextCol = 1;
        for (auto c : XmlDocument::children(row, "c")) {
            CellRef ref{rowNumber, nextCol};
            if (auto r = XmlDocument::attribute(c, "r"); !r.empty()) {
                if (auto parsed = XlsxExtractor::parseCellReference(r)) {
                    ref = *parsed;
                }
            }
            nextCol = std::min(ref.col + 1, kMaxColumns);
            auto value = cellValue(c, shared);
            if (!value.empty()) {
                cells.push_back({ref.row, ref.col, std::move(value)});
            }
        }
        nextRow = std::min(rowNumber + 1, kMaxRows);
    }
    return cells;
}

// Bounding box of the populated cells, anchored no later than the declared origin
SheetDimension populatedExtent(const std::vector<SheetCell>& cells, const SheetDimension& dim) {
    SheetDimension extent{dim.first, {0, 0}};
    for (const auto& cell : cells) {
        extent.first.row = std::min(extent.first.row, cell.row);
        extent.first.col = std::min(extent.first.col, cell.col);
        extent.last.row = std::max(extent.last.row, cell.row);
        extent.last.col = std::max(extent.last.col, cell.col);
    }
    return extent;
}

std::vector<std::vector<std::string>> denseGrid(const std::vector<SheetCell>& cells,
                                                const SheetDimension& extent) {
    std::vector<std::vector<std::string>> grid(
        extent.last.row - extent.first.row + 1,
        std::vector<std::string>(extent.last.col - extent.first.col + 1));
    for (const auto& cell : cells) {
        grid[cell.row - extent.first.row][cell.col - extent.first.col] = cell.value;
    }
    return grid;
}

// Only rows and columns that hold at least one value; nullopt if even that is too large
std::optional<std::vector<std::vector<std::string>>>
sparseGrid(const std::vector<SheetCell>& cells) {
    std::map<uint32_t, size_t> rowIndex;
    std::map<uint32_t, size_t> colIndex;
    for (const auto& cell : cells) {
        rowIndex.emplace(cell.row, 0);
        colIndex.emplace(cell.col, 0);
    }
    if (static_cast<uint64_t>(rowIndex.size()) * colIndex.size() > kMaxDenseCells) {
        return std::nullopt;
    }
    size_t i = 0;
    for (auto& [_, idx] : rowIndex) {
        idx = i++;
    }
    i = 0;
    for (auto& [_, idx] : colIndex) {
        idx = i++;
    }
    std::vector<std::vector<std::string>> grid(rowIndex.size(),
                                               std::vector<std::string>(colIndex.size()));
    for (const auto& cell : cells) {
        grid[rowIndex[cell.row]][colIndex[cell.col]] = cell.value;
    }
    return grid;
}

} // namespace

uint64_t SheetDimension::cellCount() const {
    const uint64_t rows = last.row >= first.row ? uint64_t{last.row} - first.row + 1 : 1;
    const uint64_t cols = last.col >= first.col ? uint64_t{last.col} - first.col + 1 : 1;
    if (cols != 0 && rows > std::numeric_limits<uint64_t>::max() / cols) {
        return std::numeric_limits<uint64_t>::max();
    }
    return rows * cols;
}

std::optional<CellRef> XlsxExtractor::parseCellReference(std::string_view ref) {
    size_t i = 0;
    uint64_t col = 0;
    while (i < ref.size() && ref[i] == '$') {
        ++i;
    }
    const size_t letters = i;
    while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i]))) {
        col = col * 26 + static_cast<uint64_t>(std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
        if (col > kMaxColumns || i - letters >= 3) {
            return std::nullopt;
        }
        ++i;
    }
    if (col == 0) {
        return std::nullopt;
    }
    if (i < ref.size() && ref[i] == '$') {
        ++i;
    }
    uint64_t row = 0;
    const size_t digits = i;
    while (i < ref.size() && std::isdigit(static_cast<unsigned char>(ref[i]))) {
        row = row * 10 + static_cast<uint64_t>(ref[i] - '0');
        if (row > kMaxRows) {
            return std::nullopt;
        }
        ++i;
    }
    if (i == digits || i != ref.size() || row == 0) {
        return std::nullopt;
    }
    return CellRef{static_cast<uint32_t>(row), static_cast<uint32_t>(col)};
}

std::optional<SheetDimension> XlsxExtractor::parseDimension(std::string_view ref) {
    auto colon = ref.find(':');
    auto first = parseCellReference(ref.substr(0, colon));
    if (!first) {
        return std::nullopt;
    }
    if (colon == std::string_view::npos) {
        return SheetDimension{*first, *first};
    }
    auto last = parseCellReference(ref.substr(colon + 1));
    if (!last) {
        return std::nullopt;
    }
    return SheetDimension{*first, *last};
}

std::string XlsxExtractor::columnName(uint32_t col) {
    std::string name;
    while (col > 0) {
        --col;
        name.insert(name.begin(), static_cast<char>('A' + col % 26));
        col /= 26;
    }
    return name;
}

std::vector<std::string> XlsxExtractor::supportedMimeTypes() const {
    return {std::string(mime::kXlsx), std::string(mime::kXlsm)};
}

Result<ExtractionResult> XlsxExtractor::extract(std::span<const std::byte> data,
                                                const std::string& mimeType,
                                                const ExtractionConfig& /*config*/) {
    ArchiveReader zip(data);
    auto parts = zip.readEntries([](const std::string& name) {
        return name == "xl/workbook.xml" || name == "xl/_rels/workbook.xml.rels" ||
               name == "xl/sharedStrings.xml" ||
               (name.starts_with("xl/worksheets/") && name.ends_with(".xml")) ||
               ooxml::isPropertiesPart(name);
    });
    if (!parts) {
        return parts.error();
    }
    if (!parts.value().contains("xl/workbook.xml")) {
        return Error{ErrorCode::Parsing, "Invalid XLSX: missing xl/workbook.xml"};
    }

    auto sheets = discoverSheets(parts.value());
    const auto shared = sharedStrings(parts.value());

    ExtractionResult result;
    result.mimeType = mimeType;
    ooxml::applyCoreProperties(parts.value(), result.metadata);

    std::string content;
    nlohmann::json sheetNames = nlohmann::json::array();
    size_t sparseSheets = 0;
    size_t sheetIndex = 0;
    for (const auto& sheet : sheets) {
        ++sheetIndex;
        auto doc = XmlDocument::parse(parts.value().at(sheet.part), sheet.part);
        if (!doc) {
            spdlog::warn("Skipping unreadable sheet '{}': {}", sheet.name, doc.error().message);
            result.addWarning("extraction",
                              "Sheet '" + sheet.name + "' could not be parsed: " + doc.error().message);
            continue;
        }
        auto root = doc.value().root();
        sheetNames.push_back(sheet.name);

        auto cells = collectCells(XmlDocument::firstChild(root, "sheetData"), shared);
        if (!content.empty()) {
            content += "\n\n";
        }
        content += "## " + sheet.name + "\n\n";
        if (cells.empty()) {
            continue;
        }

        std::optional<SheetDimension> declared;
        if (auto dim = XmlDocument::firstChild(root, "dimension")) {
            declared = parseDimension(XmlDocument::attribute(dim, "ref"));
        }

        std::optional<std::vector<std::vector<std::string>>> grid;
        const CellRef origin{cells.front().row, cells.front().col};
        const auto extent = populatedExtent(cells, declared.value_or(SheetDimension{origin, origin}));
        // Cells may lie outside the declared dimension; both extents must fit
        if ((!declared || declared->cellCount() <= kMaxDenseCells) &&
            extent.cellCount() <= kMaxDenseCells) {
            grid = denseGrid(cells, extent);
        } else {
            ++sparseSheets;
            spdlog::debug("Sheet '{}' declares {} cells; using sparse layout for {} populated cells",
                          sheet.name, declared ? declared->cellCount() : 0, cells.size());
            grid = sparseGrid(cells);
        }

        if (!grid) {
            // Too scattered even for the compacted grid: emit cells one per line
            for (const auto& cell : cells) {
                content += columnName(cell.col) + std::to_string(cell.row) + "\t" + cell.value + "\n";
            }
            result.addWarning("extraction", "Sheet '" + sheet.name +
                                                "' is too sparse to render as a table");
            continue;
        }

        Table table;
        table.markdown = renderMarkdownTable(*grid);
        table.cells = std::move(*grid);
        table.pageNumber = sheetIndex;
        content += table.markdown;
        result.tables.push_back(std::move(table));
    }

    while (!content.empty() && content.back() == '\n') {
        content.pop_back();
    }
    result.content = std::move(content);
    result.metadata.set("sheet_count", sheetNames.size());
    result.metadata.set("sheet_names", std::move(sheetNames));
    if (sparseSheets > 0) {
        result.metadata.set("sparse_sheets", sparseSheets);
    }
    return result;
}

} // namespace quarry::extraction
