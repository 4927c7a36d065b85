#ifndef PROOF_ENGINE_PROVER_CONFIG_H
#define PROOF_ENGINE_PROVER_CONFIG_H

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace ProofEngine
{
    // 饱和过程的资源限制，-1 表示不限制
    struct ProverConfig
    {
        int maxIterations = 64;
        int maxClauses = 20000;
        double timeLimitSeconds = -1;
        bool dropTautologies = true;
        bool verbose = false;

        // 缺省的字段保持默认值；类型错误时抛出 std::runtime_error
        static ProverConfig fromJson(const json &j);
        static ProverConfig loadFromFile(const std::string &path);
        json toJson() const;
    };
}

#endif // PROOF_ENGINE_PROVER_CONFIG_H
