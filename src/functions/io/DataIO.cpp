// =============================================================================
// src/functions/io/DataIO.cpp - CSV 记录读写
// =============================================================================
#include "functions/io/DataIO.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <vector>

const std::vector<DataIO::Column>& DataIO::recordColumns() {
    static const std::vector<Column> columns = {
        {"Master_Index",        &Record::masterIndex},
        {"County",              &Record::county},
        {"Health level",        &Record::healthLevel},
        {"Years of Experience", &Record::yearsExperience},
        {"Prompt",              &Record::prompt},
        {"Nursing Competency",  &Record::nursingCompetency},
        {"Clinical Panel",      &Record::clinicalPanel},
        {"Clinician",           &Record::clinician},
        {"GPT4.0",              &Record::gpt4_0},
        {"LLAMA",               &Record::llama},
        {"GEMINI",              &Record::gemini},
        {"DDX SNOMED",          &Record::ddxSnomed}
    };
    return columns;
}

std::string DataIO::trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

namespace {

void stripCarriageReturn(std::string& s) {
    if (!s.empty() && s.back() == '\r') s.pop_back();
}

} // namespace

bool DataIO::readLogicalLine(std::istream& in, std::string& line) {
    line.clear();
    std::string part;
    if (!std::getline(in, part)) return false;
    stripCarriageReturn(part);
    line = part;

    // 仅当以引号开头的字段尚未闭合时才拼接下一物理行
    std::vector<std::string> cells;
    while (!splitLine(line, cells) && std::getline(in, part)) {
        stripCarriageReturn(part);
        line += '\n';
        line += part;
    }
    return true;
}

bool DataIO::splitLine(const std::string& line, std::vector<std::string>& cells) {
    cells.clear();
    std::string cur;
    bool inQuotes   = false;
    bool wasQuoted  = false;   // 当前单元格已有一段引号内容

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                cur += c;
            }
        } else if (c == '"' && !wasQuoted &&
                   cur.find_first_not_of(" \t") == std::string::npos) {
            // **只有位于单元格开头的引号才开启引号字段，字段中间的引号按普通字符处理**
            cur.clear();
            inQuotes  = true;
            wasQuoted = true;
        } else if (c == ',') {
            cells.push_back(trim(cur));
            cur.clear();
            wasQuoted = false;
        } else {
            cur += c;
        }
    }

    if (inQuotes) return false;
    cells.push_back(trim(cur));
    return true;
}

std::string DataIO::escapeCell(const std::string& cell) {
    if (cell.find_first_of(",\"\n\r") == std::string::npos) return cell;

    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::vector<Record> DataIO::readRecords(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open file: " + filename);
    }
    return readRecords(file, filename);
}

std::vector<Record> DataIO::readRecords(std::istream& in, const std::string& sourceName) {
    std::string line;
    if (!readLogicalLine(in, line)) {
        throw std::runtime_error("Empty file: " + sourceName);
    }

    // UTF-8 BOM
    if (line.rfind("\xEF\xBB\xBF", 0) == 0) {
        line.erase(0, 3);
    }
    std::vector<std::string> headers;
    if (!splitLine(line, headers)) {
        throw std::runtime_error("Malformed header in " + sourceName);
    }

    // **表头列 -> Record 字段，未知列为 nullptr**
    std::vector<std::optional<std::string> Record::*> fields(headers.size(), nullptr);
    size_t mapped = 0;
    for (size_t i = 0; i < headers.size(); ++i) {
        for (const auto& col : recordColumns()) {
            if (headers[i] == col.header) {
                fields[i] = col.field;
                ++mapped;
                break;
            }
        }
    }
    if (mapped == 0) {
        std::cerr << "Warning: no known columns in header of " << sourceName << std::endl;
    }

    std::vector<Record> rows;
    std::vector<std::string> cells;
    size_t lineNo = 1;

    while (readLogicalLine(in, line)) {
        ++lineNo;
        if (trim(line).empty()) continue;

        if (!splitLine(line, cells)) {
            std::cerr << "  skipped malformed row " << lineNo << " in " << sourceName
                      << ": unterminated quoted field" << std::endl;
            continue;
        }

        // 行可以比表头短，缺少的单元格视为缺失值
        Record rec;
        const size_t n = std::min(cells.size(), fields.size());
        for (size_t i = 0; i < n; ++i) {
            if (fields[i] && !cells[i].empty()) {
                rec.*fields[i] = cells[i];
            }
        }

        if (!rec.clinician && !rec.gpt4_0) {
            std::cerr << "Warning: '" << sourceName
                      << "' record missing both Clinician & GPT4.0 targets" << std::endl;
        }
        rows.push_back(std::move(rec));
    }

    if (rows.empty()) {
        throw std::runtime_error("No valid records in " + sourceName);
    }

    std::cout << "Loaded " << rows.size() << " records from " << sourceName << std::endl;
    return rows;
}

void DataIO::writeRecords(const std::string& filename,
                          const std::vector<Record>& records) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to write file: " + filename);
    }

    const auto& columns = recordColumns();
    for (size_t i = 0; i < columns.size(); ++i) {
        file << escapeCell(columns[i].header) << (i + 1 < columns.size() ? ',' : '\n');
    }

    for (const auto& rec : records) {
        for (size_t i = 0; i < columns.size(); ++i) {
            const auto& value = rec.*columns[i].field;
            if (value) file << escapeCell(*value);
            file << (i + 1 < columns.size() ? ',' : '\n');
        }
    }
}

void DataIO::writePredictions(const std::string& filename,
                              const std::vector<Record>& records,
                              const std::vector<Prediction>& predictions) {
    if (records.size() != predictions.size()) {
        throw std::invalid_argument("Record/prediction count mismatch: " +
                                    std::to_string(records.size()) + " vs " +
                                    std::to_string(predictions.size()));
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to write file: " + filename);
    }

    file << "Master_Index";
    for (Attribute a : allAttributes()) {
        file << ',' << escapeCell(attributeColumn(a));
    }
    for (TargetField t : allTargets()) {
        file << ',' << escapeCell(std::string("Predicted ") + targetColumn(t));
    }
    file << '\n';

    for (size_t i = 0; i < records.size(); ++i) {
        const Record& rec = records[i];
        if (rec.masterIndex) file << escapeCell(*rec.masterIndex);
        for (Attribute a : allAttributes()) {
            file << ',';
            if (rec.attribute(a)) file << escapeCell(*rec.attribute(a));
        }
        for (TargetField t : allTargets()) {
            file << ',';
            const auto& value = predictions[i].get(t);
            if (value) file << escapeCell(*value);
        }
        file << '\n';
    }

    std::cout << "Wrote " << records.size() << " predictions to " << filename << std::endl;
}
