#ifndef PROOF_ENGINE_SYMBOL_TABLE_H
#define PROOF_ENGINE_SYMBOL_TABLE_H

#include <vector>
#include <string>
#include <unordered_map>

namespace ProofEngine
{
    // 名字 <-> 编号 的双向表，谓词/函数、变量、常量各用一张
    class SymbolTable
    {
    private:
        std::vector<std::string> names;
        std::unordered_map<std::string, int> nameToId;

    public:
        int insert(const std::string &name);

        std::string get(int id) const;

        // 找不到时返回 -1
        int getId(const std::string &name) const;

        size_t size() const { return names.size(); }
    };
}

#endif // PROOF_ENGINE_SYMBOL_TABLE_H
