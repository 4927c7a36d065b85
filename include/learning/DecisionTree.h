#ifndef LEARNING_DECISION_TREE_H
#define LEARNING_DECISION_TREE_H

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Learning
{
    using Row = std::vector<std::string>;

    // 内部结点按 feature 的取值分支；叶子结点只带 decision
    struct DecisionNode
    {
        std::optional<size_t> feature;
        std::string decision;
        std::map<std::string, std::unique_ptr<DecisionNode>> children;

        bool isLeaf() const { return !feature.has_value(); }
    };

    // ID3：每次选信息增益最大的特征划分
    class DecisionTree
    {
    public:
        // rows 为空时返回 nullptr；行长度不足 target/feature 下标时抛出 std::invalid_argument
        static std::unique_ptr<DecisionNode> build(const std::vector<Row> &rows,
                                                   const std::vector<size_t> &featureIndices,
                                                   size_t targetIndex);

        // 沿分支走到叶子；遇到训练时没见过的取值返回 std::nullopt
        static std::optional<std::string> classify(const DecisionNode &root, const Row &row);

        static double entropy(const std::vector<Row> &rows, size_t targetIndex);
        static double informationGain(const std::vector<Row> &rows, size_t featureIndex, size_t targetIndex);
        static std::string majorityClass(const std::vector<Row> &rows, size_t targetIndex);

    private:
        static std::map<std::string, std::vector<Row>> splitByFeature(const std::vector<Row> &rows, size_t featureIndex);
        static std::unique_ptr<DecisionNode> buildNode(const std::vector<Row> &rows,
                                                       const std::vector<size_t> &featureIndices,
                                                       size_t targetIndex);
    };
}

#endif // LEARNING_DECISION_TREE_H
