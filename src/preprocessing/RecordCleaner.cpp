#include "preprocessing/RecordCleaner.hpp"
#include "functions/io/DataIO.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace preprocessing {

namespace {

using RecordKey = std::vector<std::optional<std::string>>;

// 去重只看建模用到的字段
RecordKey makeKey(const Record& r) {
    RecordKey key;
    key.reserve(kNumAttributes + kNumTargets);
    for (Attribute a : allAttributes()) key.push_back(r.attribute(a));
    for (TargetField t : allTargets()) key.push_back(r.target(t));
    return key;
}

} // namespace

std::optional<std::string> RecordCleaner::normalizeValue(const std::optional<std::string>& value,
                                                         bool lowerCase) {
    if (!value) return std::nullopt;
    std::string s = DataIO::trim(*value);
    if (s.empty()) return std::nullopt;
    if (lowerCase) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return s;
}

Record RecordCleaner::normalize(const Record& record) {
    Record out;
    for (const auto& col : DataIO::recordColumns()) {
        out.*col.field = normalizeValue(record.*col.field, false);
    }
    for (Attribute a : allAttributes()) {
        out.attribute(a) = normalizeValue(record.attribute(a), true);
    }
    return out;
}

std::vector<Record> RecordCleaner::deduplicate(const std::vector<Record>& records,
                                               size_t& removed) {
    std::set<RecordKey> seen;
    std::vector<Record> unique;
    unique.reserve(records.size());

    for (const auto& rec : records) {
        if (seen.insert(makeKey(rec)).second) {
            unique.push_back(rec);
        }
    }

    removed = records.size() - unique.size();
    return unique;
}

std::vector<Record> RecordCleaner::clean(const std::vector<Record>& records) {
    std::vector<Record> normalized;
    normalized.reserve(records.size());
    for (const auto& rec : records) {
        normalized.push_back(normalize(rec));
    }

    size_t removed = 0;
    auto cleaned = deduplicate(normalized, removed);
    std::cout << "Cleaned " << records.size() << " records: "
              << removed << " duplicates removed, "
              << cleaned.size() << " kept" << std::endl;
    return cleaned;
}

} // namespace preprocessing
