// SymbolType.h
#ifndef PROOF_ENGINE_SYMBOL_TYPE_H
#define PROOF_ENGINE_SYMBOL_TYPE_H
#include <functional>
namespace ProofEngine
{
    enum class SymbolType
    {
        CONSTANT,
        VARIABLE,
        FUNCTOR // 谓词名和函数名
    };

    struct SymbolId
    {
        SymbolType type;
        int id;

        bool operator==(const SymbolId &other) const
        {
            return type == other.type && id == other.id;
        }

        bool operator!=(const SymbolId &other) const
        {
            return !(*this == other);
        }

        bool operator<(const SymbolId &other) const
        {
            if (type != other.type)
            {
                return type < other.type;
            }
            return id < other.id;
        }
    };
}

namespace std
{
    template <>
    struct hash<ProofEngine::SymbolId>
    {
        std::size_t operator()(const ProofEngine::SymbolId &symbolId) const
        {
            std::size_t h1 = std::hash<int>{}(static_cast<int>(symbolId.type));
            std::size_t h2 = std::hash<int>{}(symbolId.id);
            return h1 ^ (h2 << 1);
        }
    };
}

#endif // PROOF_ENGINE_SYMBOL_TYPE_H
