#ifndef PROOF_ENGINE_RESOLVER_H
#define PROOF_ENGINE_RESOLVER_H

#include "Clause.h"
#include "KnowledgeBase.h"
#include "Unifier.h"
#include <optional>
#include <vector>

namespace ProofEngine
{
    class Resolver
    {
    public:
        // c1 与 c2 的全部二元消解式（去重）。c2 会先与 c1 变量分离；
        // 两个子句的因子也参与消解。
        static std::vector<Clause> resolve(const Clause &c1, const Clause &c2, KnowledgeBase &kb);

        // 在第 l1、l2 个文字上消解；调用方负责保证两个子句没有公共变量
        static std::optional<Clause> resolvePair(const Clause &c1, const Clause &c2, int l1, int l2);

        // 同极性文字两两合一得到的全部因子（含因子的因子），不含 clause 本身
        static std::vector<Clause> factors(const Clause &clause);

        // 极性相反且原子可以合一时返回 MGU。
        // 原子在文本上完全相同（L 与 ¬L）是其中的特例，得到空替换。
        // 原子是变量的文字不与任何文字互补。
        static UnifyResult complementaryUnifier(const Literal &lit1, const Literal &lit2);

        // 廉价的预筛：极性相反，且谓词与元数相同
        static bool isComplementary(const Literal &lit1, const Literal &lit2);
    };
}

#endif // PROOF_ENGINE_RESOLVER_H
