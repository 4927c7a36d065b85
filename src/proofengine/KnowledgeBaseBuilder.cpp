#include "KnowledgeBaseBuilder.h"
#include "Parser.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ProofEngine
{
    Literal KnowledgeBaseBuilder::parseLiteral(const std::string &text, KnowledgeBase &kb)
    {
        fol_parse_result = nullptr;
        fol_parse_error.clear();

        fol_scan_begin(text);
        int status = yyparse();
        fol_scan_end();

        std::unique_ptr<AST::Node> root(fol_parse_result);
        fol_parse_result = nullptr;
        if (status != 0 || !root)
        {
            throw ParseError(text, fol_parse_error.empty() ? "syntax error" : fol_parse_error);
        }
        return buildLiteral(root.get(), kb);
    }

    Clause KnowledgeBaseBuilder::parseClause(const std::vector<std::string> &literals, KnowledgeBase &kb)
    {
        Clause clause;
        for (const auto &text : literals)
        {
            clause.addLiteral(parseLiteral(text, kb));
        }
        return clause;
    }

    bool KnowledgeBaseBuilder::readClause(const std::string &filename, KnowledgeBase &kb)
    {
        std::ifstream file(filename);
        if (!file.is_open())
        {
            std::cerr << "Cannot open file: " << filename << std::endl;
            return false;
        }

        Clause clause;
        std::string line;
        int lineNumber = 0;
        while (std::getline(file, line))
        {
            lineNumber++;
            if (line.find_first_not_of(" \t\r") == std::string::npos)
            {
                continue;
            }
            try
            {
                clause.addLiteral(parseLiteral(line, kb));
            }
            catch (const ParseError &e)
            {
                std::cerr << filename << ":" << lineNumber << ": " << e.what() << std::endl;
                return false;
            }
        }
        // 空文件不贡献子句（空子句会让 KB 直接矛盾）
        if (!clause.isEmpty())
        {
            kb.addClause(clause);
        }
        return true;
    }

    bool KnowledgeBaseBuilder::parseDirectory(const std::string &input_dir, KnowledgeBase &kb)
    {
        std::vector<fs::path> files;
        for (const auto &entry : fs::directory_iterator(input_dir))
        {
            if (entry.path().extension() == ".txt")
            {
                files.push_back(entry.path());
            }
        }
        // directory_iterator 的顺序不确定，按文件名排序保证子句顺序稳定
        std::sort(files.begin(), files.end());

        for (const auto &path : files)
        {
            if (!readClause(path.string(), kb))
            {
                std::cerr << "Failed to read clause from " << path.string() << std::endl;
                return false;
            }
        }
        return true;
    }

    Clause KnowledgeBaseBuilder::loadProblem(const json &problem, KnowledgeBase &kb, ProverConfig *config)
    {
        if (!problem.is_object())
        {
            throw std::runtime_error("problem must be a JSON object");
        }

        if (problem.contains("clauses"))
        {
            const json &clauses = problem.at("clauses");
            if (!clauses.is_array())
            {
                throw std::runtime_error("\"clauses\" must be an array of literal lists");
            }
            for (const auto &clause : clauses)
            {
                kb.addClause(parseClause(readLiteralList(clause, "clause"), kb));
            }
        }

        if (!problem.contains("query"))
        {
            throw std::runtime_error("problem has no \"query\"");
        }
        Clause query = parseClause(readLiteralList(problem.at("query"), "query"), kb);

        if (config != nullptr && problem.contains("prover"))
        {
            *config = ProverConfig::fromJson(problem.at("prover"));
        }
        return query;
    }

    Clause KnowledgeBaseBuilder::readProblemFile(const std::string &filename, KnowledgeBase &kb, ProverConfig *config)
    {
        std::ifstream file(filename);
        if (!file.is_open())
        {
            throw std::runtime_error("cannot open problem file: " + filename);
        }

        json problem;
        try
        {
            file >> problem;
        }
        catch (const json::parse_error &e)
        {
            throw std::runtime_error("cannot parse problem file " + filename + ": " + e.what());
        }
        return loadProblem(problem, kb, config);
    }

    Literal KnowledgeBaseBuilder::buildLiteral(const AST::Node *node, KnowledgeBase &kb)
    {
        if (node->getType() == AST::Node::NOT)
        {
            const auto *notNode = static_cast<const AST::UnaryOpNode *>(node);
            return Literal(buildTerm(notNode->child, kb), true);
        }
        return Literal(buildTerm(node, kb), false);
    }

    Term KnowledgeBaseBuilder::buildTerm(const AST::Node *node, KnowledgeBase &kb)
    {
        switch (node->getType())
        {
        case AST::Node::VARIABLE:
            return Term(kb.addVariable(node->name));
        case AST::Node::CONSTANT:
            return Term(kb.addConstant(node->name));
        case AST::Node::PREDICATE:
        {
            const auto *predicate = static_cast<const AST::PredicateNode *>(node);
            return Term::compound(kb.addFunctor(node->name), buildArguments(predicate->termlists, kb));
        }
        case AST::Node::FUNCTION:
        {
            const auto *function = static_cast<const AST::FunctionNode *>(node);
            return Term::compound(kb.addFunctor(node->name), buildArguments(function->termlists, kb));
        }
        default:
            throw std::logic_error("unexpected AST node in term position: " + node->toString());
        }
    }

    std::vector<Term> KnowledgeBaseBuilder::buildArguments(const AST::TermListNode *termList, KnowledgeBase &kb)
    {
        std::vector<Term> arguments;
        if (termList == nullptr)
        {
            return arguments;
        }
        for (const AST::Node *arg : termList->arguments)
        {
            arguments.push_back(buildTerm(arg, kb));
        }
        return arguments;
    }

    std::vector<std::string> KnowledgeBaseBuilder::readLiteralList(const json &list, const std::string &what)
    {
        if (!list.is_array())
        {
            throw std::runtime_error(what + " must be an array of literal strings");
        }
        std::vector<std::string> literals;
        for (const auto &item : list)
        {
            if (!item.is_string())
            {
                throw std::runtime_error(what + " contains a non-string literal: " + item.dump());
            }
            literals.push_back(item.get<std::string>());
        }
        return literals;
    }
}
