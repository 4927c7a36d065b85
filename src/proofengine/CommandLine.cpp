#include "CommandLine.h"
#include "KnowledgeBase.h"
#include "KnowledgeBaseBuilder.h"
#include "ProverConfig.h"

namespace ProofEngine
{
    int CommandLine::exitCode(ProofStatus status)
    {
        switch (status)
        {
        case ProofStatus::PROVED:
            return 0;
        case ProofStatus::NOT_ENTAILED:
            return 1;
        default:
            return 2;
        }
    }

    int CommandLine::run(int argc, const char *const *argv, std::ostream &out, std::ostream &err)
    {
        if (argc < 2 || argc > 3)
        {
            err << "Usage: " << (argc > 0 ? argv[0] : "proofengine") << " <problem.json> [config.json]" << std::endl;
            return 3;
        }

        KnowledgeBase kb;
        ProverConfig config;
        Clause query;
        try
        {
            query = KnowledgeBaseBuilder::readProblemFile(argv[1], kb, &config);
            // 命令行给出的配置文件覆盖问题文件里的 "prover"
            if (argc == 3)
            {
                config = ProverConfig::loadFromFile(argv[2]);
            }
        }
        catch (const std::exception &e)
        {
            err << "Error: " << e.what() << std::endl;
            return 3;
        }

        kb.print(out);
        out << "Query: " << query.toString(kb) << std::endl;

        ProofResult result = Resolution::prove(kb, query, config);

        out << "Result: " << toString(result.status) << std::endl;
        out << "Rounds: " << result.iterations
            << ", generated clauses: " << result.generatedClauses
            << ", working set: " << result.workingSetSize
            << ", time: " << result.durationMs << " ms" << std::endl;
        return exitCode(result.status);
    }
}
