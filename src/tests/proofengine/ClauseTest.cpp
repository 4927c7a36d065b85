#include <gtest/gtest.h>
#include "Clause.h"
#include "Literal.h"
#include "KnowledgeBase.h"
#include "KnowledgeBaseBuilder.h"

namespace ProofEngine
{
    class ClauseTest : public ::testing::Test
    {
    protected:
        KnowledgeBase kb;

        Literal lit(const std::string &text)
        {
            return KnowledgeBaseBuilder::parseLiteral(text, kb);
        }

        Clause clause(const std::vector<std::string> &literals)
        {
            return KnowledgeBaseBuilder::parseClause(literals, kb);
        }
    };

    TEST_F(ClauseTest, DuplicateLiteralsAreMerged)
    {
        Clause c;
        c.addLiteral(lit("P(a)"));
        c.addLiteral(lit("P( a )"));
        c.addLiteral(lit("¬P(a)"));
        EXPECT_EQ(c.size(), 2);
    }

    TEST_F(ClauseTest, FindLiteralIndex)
    {
        Clause c = clause({"R(x)", "¬R(y)", "P(x,y)"});

        EXPECT_EQ(c.findLiteralIndex(lit("R(x)")), 0);
        EXPECT_EQ(c.findLiteralIndex(lit("¬R(y)")), 1);
        EXPECT_EQ(c.findLiteralIndex(lit("P(x,y)")), 2);
        EXPECT_EQ(c.findLiteralIndex(lit("R(z)")), -1);
        EXPECT_TRUE(c.contains(lit("¬R(y)")));
    }

    TEST_F(ClauseTest, EqualityIgnoresOrder)
    {
        Clause c1 = clause({"A", "¬B", "C(x)"});
        Clause c2 = clause({"C(x)", "A", "¬B"});
        Clause c3 = clause({"A", "B", "C(x)"});

        EXPECT_EQ(c1, c2);
        EXPECT_EQ(c1.hash(), c2.hash());
        EXPECT_NE(c1, c3);
    }

    TEST_F(ClauseTest, Tautology)
    {
        EXPECT_TRUE(clause({"P(x)", "Q", "¬P(x)"}).isTautology());
        EXPECT_FALSE(clause({"P(x)", "¬P(Ann)"}).isTautology());
        EXPECT_FALSE(clause({"A", "B"}).isTautology());
    }

    TEST_F(ClauseTest, ToString)
    {
        EXPECT_EQ(clause({"P(a)", "¬Q(b)"}).toString(kb), "P(a) ∨ ¬Q(b)");
        EXPECT_EQ(Clause().toString(kb), "□");
        EXPECT_TRUE(Clause().isEmpty());
    }

    TEST_F(ClauseTest, VariantKeyIgnoresVariableNames)
    {
        Clause c1 = clause({"P(x)", "Q(x,y)"});
        Clause c2 = clause({"Q(z,w)", "P(z)"});
        Clause c3 = clause({"P(x)", "Q(y,x)"});

        EXPECT_NE(c1, c2);
        EXPECT_EQ(c1.variantKey(), c2.variantKey());
        EXPECT_NE(c1.variantKey(), c3.variantKey());
        EXPECT_NE(clause({"P(x)"}).variantKey(), clause({"P(Ann)"}).variantKey());
        EXPECT_EQ(clause({"P(x)"}).variantKey(), clause({"P(a)"}).variantKey());
    }

    TEST_F(ClauseTest, CollectVariables)
    {
        Clause c = clause({"P(x, f(y))", "Q(Ann)"});
        auto vars = c.collectVariables();
        EXPECT_EQ(vars.size(), 2);
        EXPECT_EQ(vars.count(kb.getSymbolId("x").value()), 1);
        EXPECT_EQ(vars.count(kb.getSymbolId("y").value()), 1);
    }
}
