#pragma once

#include "data/Record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace preprocessing {

class RecordCleaner {
public:
    /**
     * 规范化单个值：去除首尾空白，空串视为缺失
     * @param lowerCase 是否转为小写（属性值使用）
     */
    static std::optional<std::string> normalizeValue(const std::optional<std::string>& value,
                                                     bool lowerCase);

    /**
     * 规范化整条记录：所有字段去空白，属性值转小写，目标值保留原大小写
     */
    static Record normalize(const Record& record);

    /**
     * 去除属性和目标字段完全相同的重复记录，保留首次出现
     * @param removed 输出：被去除的记录数
     */
    static std::vector<Record> deduplicate(const std::vector<Record>& records,
                                           size_t& removed);

    /** normalize + deduplicate */
    static std::vector<Record> clean(const std::vector<Record>& records);
};

} // namespace preprocessing
