#pragma once

#include "data/Record.hpp"
#include <map>
#include <memory>
#include <string>
#include <cstddef>
#include <utility>

/**
 * 分类树节点：Leaf{value} 或 Branch{attribute, children, majority}
 * children 为有序 map，遍历顺序与平台无关；每个 Branch 独占其子节点
 */
struct Node {
    bool   isLeaf  = true;
    size_t samples = 0;
    double metric  = 0.0;      // 节点熵

    Attribute   attribute = Attribute::ClinicalPanel;
    std::string value;         // Leaf: 预测值；Branch: 多数类
    std::map<std::string, std::unique_ptr<Node>> children;

    void makeLeaf(std::string prediction) {
        isLeaf = true;
        value  = std::move(prediction);
        children.clear();
    }

    void makeBranch(Attribute splitAttribute, std::string majority) {
        isLeaf    = false;
        attribute = splitAttribute;
        value     = std::move(majority);
    }

    Node* addChild(const std::string& key) {
        auto& slot = children[key];
        slot = std::make_unique<Node>();
        return slot.get();
    }

    Attribute getAttribute() const { return attribute; }

    const std::string& getPrediction() const { return value; }

    const std::string& getMajority() const { return value; }

    const Node* getChild(const std::string& key) const {
        auto it = children.find(key);
        return it == children.end() ? nullptr : it->second.get();
    }
};
