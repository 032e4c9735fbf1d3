// =============================================================================
// include/functions/io/DataIO.hpp - 记录读写
// =============================================================================
#pragma once

#include "data/Record.hpp"
#include "data/Prediction.hpp"
#include <istream>
#include <optional>
#include <string>
#include <vector>

class DataIO {
public:
    /** CSV 列名与 Record 字段的对应关系 */
    struct Column {
        const char* header;
        std::optional<std::string> Record::* field;
    };

    static const std::vector<Column>& recordColumns();

    /**
     * 读取带表头的 CSV，按列名映射到 Record
     * 未知列被忽略；无法解析的行跳过并告警；没有任何有效记录时抛出 std::runtime_error
     */
    std::vector<Record> readRecords(const std::string& filename);

    std::vector<Record> readRecords(std::istream& in, const std::string& sourceName);

    /** 按 recordColumns() 的顺序写出全部字段 */
    void writeRecords(const std::string& filename,
                      const std::vector<Record>& records);

    /** 写出 Master_Index、属性列以及每个目标字段的预测值 */
    void writePredictions(const std::string& filename,
                          const std::vector<Record>& records,
                          const std::vector<Prediction>& predictions);

    // **CSV 行工具**

    /** 读取一条逻辑行（引号内的换行属于同一行）；流结束返回 false */
    static bool readLogicalLine(std::istream& in, std::string& line);

    /**
     * 按 RFC 4180 拆分，单元格去除首尾空白；引号未闭合时返回 false
     * 只有单元格开头的引号开启引号字段，字段中间的引号保留为普通字符
     */
    static bool splitLine(const std::string& line, std::vector<std::string>& cells);

    /** 需要时加引号并转义 */
    static std::string escapeCell(const std::string& cell);

    static std::string trim(const std::string& s);
};
