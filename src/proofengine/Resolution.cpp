// Resolution.cpp
#include "Resolution.h"
#include "Resolver.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <unordered_set>

namespace ProofEngine
{
    namespace
    {
        // 单调增长的工作集，按变体去重
        class WorkingSet
        {
        public:
            bool contains(const Clause &clause) const
            {
                return keys.find(clause.variantKey()) != keys.end();
            }

            bool insert(const Clause &clause)
            {
                if (!keys.insert(clause.variantKey()).second)
                {
                    return false;
                }
                clauses.push_back(clause);
                return true;
            }

            const std::vector<Clause> &getClauses() const { return clauses; }
            size_t size() const { return clauses.size(); }

        private:
            std::vector<Clause> clauses;
            std::unordered_set<std::string> keys;
        };
    }

    std::string toString(ProofStatus status)
    {
        switch (status)
        {
        case ProofStatus::RUNNING:
            return "Running";
        case ProofStatus::PROVED:
            return "Proved";
        case ProofStatus::NOT_ENTAILED:
            return "NotEntailed";
        case ProofStatus::INCONCLUSIVE:
            return "Inconclusive";
        }
        return "Unknown";
    }

    std::vector<Clause> Resolution::negateQuery(const Clause &query)
    {
        std::vector<Clause> negated;
        for (const auto &lit : query.getLiterals())
        {
            Clause unit;
            unit.addLiteral(lit.complement());
            negated.push_back(unit);
        }
        return negated;
    }

    ProofResult Resolution::prove(KnowledgeBase &kb, const Clause &query, const ProverConfig &config)
    {
        ProofResult result;
        auto start_time = std::chrono::steady_clock::now();
        auto finish = [&](ProofStatus status, size_t workingSetSize)
        {
            result.status = status;
            result.workingSetSize = workingSetSize;
            result.durationMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
            if (config.verbose)
            {
                std::cout << "Resolution finished: " << toString(status) << " after " << result.iterations
                          << " rounds, " << workingSetSize << " clauses" << std::endl;
            }
            return result;
        };
        auto outOfTime = [&]()
        {
            if (config.timeLimitSeconds <= 0)
                return false;
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
            return elapsed > config.timeLimitSeconds;
        };

        // 空查询只在 KB 自身矛盾时被蕴含，不需要特殊处理
        WorkingSet working;
        for (const auto &clause : kb.getClauses())
        {
            if (clause.isEmpty())
                return finish(ProofStatus::PROVED, working.size());
            if (config.dropTautologies && clause.isTautology())
                continue;
            working.insert(clause);
        }
        for (const auto &clause : negateQuery(query))
        {
            working.insert(clause);
        }

        // [0, frontier) 之间的子句对在之前的轮次里已经消解过
        size_t frontier = 0;
        while (true)
        {
            if (config.maxIterations >= 0 && result.iterations >= config.maxIterations)
                return finish(ProofStatus::INCONCLUSIVE, working.size());
            result.iterations++;

            const size_t n = working.size();
            std::vector<Clause> candidates;
            std::unordered_set<std::string> candidateKeys;

            for (size_t i = 0; i < n; ++i)
            {
                for (size_t j = std::max(i + 1, frontier); j < n; ++j)
                {
                    // working 在本轮内不会增长，引用保持有效
                    const Clause &c1 = working.getClauses()[i];
                    const Clause &c2 = working.getClauses()[j];
                    for (auto &resolvent : Resolver::resolve(c1, c2, kb))
                    {
                        if (resolvent.isEmpty())
                        {
                            if (config.verbose)
                            {
                                std::cout << "Empty clause from " << c1.toString(kb) << "  and  " << c2.toString(kb) << std::endl;
                            }
                            return finish(ProofStatus::PROVED, working.size());
                        }
                        if (config.dropTautologies && resolvent.isTautology())
                            continue;
                        if (working.contains(resolvent))
                            continue;
                        if (candidateKeys.insert(resolvent.variantKey()).second)
                        {
                            candidates.push_back(std::move(resolvent));
                        }
                    }
                }
                if (outOfTime())
                    return finish(ProofStatus::INCONCLUSIVE, working.size());
            }

            if (config.verbose)
            {
                std::cout << "Round " << result.iterations << ": " << n << " clauses, "
                          << candidates.size() << " new resolvents" << std::endl;
            }

            // 不动点：没有产生任何新子句
            if (candidates.empty())
                return finish(ProofStatus::NOT_ENTAILED, working.size());

            frontier = n;
            for (const auto &clause : candidates)
            {
                working.insert(clause);
            }
            result.generatedClauses += candidates.size();

            if (config.maxClauses >= 0 && working.size() > static_cast<size_t>(config.maxClauses))
                return finish(ProofStatus::INCONCLUSIVE, working.size());
        }
    }
}
