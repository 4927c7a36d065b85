#include "DecisionTree.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace Learning
{
    std::unique_ptr<DecisionNode> DecisionTree::build(const std::vector<Row> &rows,
                                                      const std::vector<size_t> &featureIndices,
                                                      size_t targetIndex)
    {
        size_t required = targetIndex;
        for (size_t feature : featureIndices)
        {
            required = std::max(required, feature);
        }
        for (const auto &row : rows)
        {
            if (row.size() <= required)
            {
                throw std::invalid_argument("row has " + std::to_string(row.size()) +
                                            " fields, index " + std::to_string(required) + " requested");
            }
        }
        return buildNode(rows, featureIndices, targetIndex);
    }

    std::unique_ptr<DecisionNode> DecisionTree::buildNode(const std::vector<Row> &rows,
                                                          const std::vector<size_t> &featureIndices,
                                                          size_t targetIndex)
    {
        if (rows.empty())
        {
            return nullptr;
        }

        auto node = std::make_unique<DecisionNode>();

        // 所有样本同一类别
        bool pure = std::all_of(rows.begin(), rows.end(), [&](const Row &row)
                                { return row[targetIndex] == rows.front()[targetIndex]; });
        if (pure)
        {
            node->decision = rows.front()[targetIndex];
            return node;
        }
        if (featureIndices.empty())
        {
            node->decision = majorityClass(rows, targetIndex);
            return node;
        }

        // 增益相同时取先出现的特征
        size_t bestFeature = featureIndices.front();
        double bestGain = -1.0;
        for (size_t feature : featureIndices)
        {
            double gain = informationGain(rows, feature, targetIndex);
            if (gain > bestGain)
            {
                bestGain = gain;
                bestFeature = feature;
            }
        }
        if (bestGain <= 0)
        {
            node->decision = majorityClass(rows, targetIndex);
            return node;
        }

        std::vector<size_t> remaining;
        for (size_t feature : featureIndices)
        {
            if (feature != bestFeature)
            {
                remaining.push_back(feature);
            }
        }

        node->feature = bestFeature;
        node->decision = majorityClass(rows, targetIndex);
        for (auto &[value, subset] : splitByFeature(rows, bestFeature))
        {
            node->children[value] = buildNode(subset, remaining, targetIndex);
        }
        return node;
    }

    std::optional<std::string> DecisionTree::classify(const DecisionNode &root, const Row &row)
    {
        const DecisionNode *current = &root;
        while (!current->isLeaf())
        {
            size_t feature = *current->feature;
            if (feature >= row.size())
            {
                return std::nullopt;
            }
            auto it = current->children.find(row[feature]);
            if (it == current->children.end() || !it->second)
            {
                return std::nullopt;
            }
            current = it->second.get();
        }
        return current->decision;
    }

    double DecisionTree::entropy(const std::vector<Row> &rows, size_t targetIndex)
    {
        if (rows.empty())
        {
            return 0.0;
        }

        std::unordered_map<std::string, size_t> counts;
        for (const auto &row : rows)
        {
            counts[row[targetIndex]]++;
        }

        double result = 0.0;
        double total = static_cast<double>(rows.size());
        for (const auto &[label, count] : counts)
        {
            double p = count / total;
            result -= p * std::log2(p);
        }
        return result;
    }

    double DecisionTree::informationGain(const std::vector<Row> &rows, size_t featureIndex, size_t targetIndex)
    {
        double total = static_cast<double>(rows.size());
        double weighted = 0.0;
        for (const auto &[value, subset] : splitByFeature(rows, featureIndex))
        {
            weighted += (subset.size() / total) * entropy(subset, targetIndex);
        }
        return entropy(rows, targetIndex) - weighted;
    }

    std::string DecisionTree::majorityClass(const std::vector<Row> &rows, size_t targetIndex)
    {
        // 票数相同时取先出现的类别
        std::vector<std::pair<std::string, size_t>> counts;
        for (const auto &row : rows)
        {
            const std::string &label = row[targetIndex];
            auto it = std::find_if(counts.begin(), counts.end(), [&](const auto &entry)
                                   { return entry.first == label; });
            if (it == counts.end())
            {
                counts.emplace_back(label, 1);
            }
            else
            {
                it->second++;
            }
        }

        std::string best;
        size_t bestCount = 0;
        for (const auto &[label, count] : counts)
        {
            if (count > bestCount)
            {
                best = label;
                bestCount = count;
            }
        }
        return best;
    }

    std::map<std::string, std::vector<Row>> DecisionTree::splitByFeature(const std::vector<Row> &rows, size_t featureIndex)
    {
        std::map<std::string, std::vector<Row>> subsets;
        for (const auto &row : rows)
        {
            subsets[row[featureIndex]].push_back(row);
        }
        return subsets;
    }
}
