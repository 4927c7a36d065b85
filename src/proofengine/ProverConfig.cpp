#include "ProverConfig.h"
#include <fstream>
#include <stdexcept>

namespace ProofEngine
{
    ProverConfig ProverConfig::fromJson(const json &j)
    {
        if (!j.is_object())
        {
            throw std::runtime_error("prover config must be a JSON object");
        }

        ProverConfig config;
        try
        {
            config.maxIterations = j.value("maxIterations", config.maxIterations);
            config.maxClauses = j.value("maxClauses", config.maxClauses);
            config.timeLimitSeconds = j.value("timeLimitSeconds", config.timeLimitSeconds);
            config.dropTautologies = j.value("dropTautologies", config.dropTautologies);
            config.verbose = j.value("verbose", config.verbose);
        }
        catch (const json::exception &e)
        {
            throw std::runtime_error(std::string("invalid prover config: ") + e.what());
        }
        return config;
    }

    ProverConfig ProverConfig::loadFromFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("cannot open config file: " + path);
        }

        json j;
        try
        {
            file >> j;
        }
        catch (const json::parse_error &e)
        {
            throw std::runtime_error("cannot parse config file " + path + ": " + e.what());
        }
        return fromJson(j);
    }

    json ProverConfig::toJson() const
    {
        return {
            {"maxIterations", maxIterations},
            {"maxClauses", maxClauses},
            {"timeLimitSeconds", timeLimitSeconds},
            {"dropTautologies", dropTautologies},
            {"verbose", verbose}};
    }
}
